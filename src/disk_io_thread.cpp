#include "disk_io_thread.h"

#include <iostream>
#include <utility>

DiskIoThread::DiskIoThread(DiskTileCache& cache)
    : m_cache(cache)
{
}

DiskIoThread::~DiskIoThread()
{
    stop();
}

void DiskIoThread::start()
{
    if (m_running)
    {
        return;
    }

    m_running = true;
    m_workerThread = std::thread(&DiskIoThread::ioWorker, this);
    std::cout << "DiskIoThread: Started disk I/O thread for " << m_cache.getCacheDir() << std::endl;
}

void DiskIoThread::stop(bool discardPending)
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_running)
        {
            return;
        }
        if (discardPending)
        {
            m_queue.clear();
        }
        m_running = false;
    }
    m_queueCondition.notify_all();

    if (m_workerThread.joinable())
    {
        m_workerThread.join();
    }
    m_idleCondition.notify_all();

    std::cout << "DiskIoThread: Stopped disk I/O thread" << std::endl;
}

void DiskIoThread::write(CacheKey key, std::vector<uint8_t> pixels, uint32_t width, uint32_t height,
                         WriteCallback onDone)
{
    Request request{RequestType::Write};
    request.key = key;
    request.pixels = std::move(pixels);
    request.width = width;
    request.height = height;
    request.onWrite = std::move(onDone);
    enqueue(std::move(request));
}

void DiskIoThread::read(CacheKey key, ReadCallback onDone)
{
    Request request{RequestType::Read};
    request.key = key;
    request.onRead = std::move(onDone);
    enqueue(std::move(request));
}

void DiskIoThread::remove(CacheKey key)
{
    Request request{RequestType::Remove};
    request.key = key;
    enqueue(std::move(request));
}

void DiskIoThread::enqueue(Request request)
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_running)
        {
            std::cerr << "DiskIoThread: Dropping request for tile " << request.key << ", thread not running"
                      << std::endl;
            return;
        }
        m_queue.push_back(std::move(request));
    }
    m_queueCondition.notify_one();
}

void DiskIoThread::flush()
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_idleCondition.wait(lock, [this] { return (m_queue.empty() && !m_busy) || !m_running; });
}

size_t DiskIoThread::pendingRequests() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size() + (m_busy ? 1 : 0);
}

void DiskIoThread::ioWorker()
{
    while (true)
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_queueCondition.wait(lock, [this] { return !m_queue.empty() || !m_running; });

        if (m_queue.empty())
        {
            // Stopped and drained
            break;
        }

        Request request = std::move(m_queue.front());
        m_queue.pop_front();
        m_busy = true;
        lock.unlock();

        execute(request);
        ++m_completed;

        lock.lock();
        m_busy = false;
        bool idle = m_queue.empty();
        lock.unlock();
        if (idle)
        {
            m_idleCondition.notify_all();
        }
    }
}

void DiskIoThread::execute(Request& request)
{
    try
    {
        switch (request.type)
        {
        case RequestType::Write:
        {
            bool stored = m_cache.put(request.key, request.pixels, request.width, request.height);
            if (request.onWrite)
            {
                request.onWrite(stored);
            }
            break;
        }
        case RequestType::Read:
        {
            // Readers always get an answer; a failed read is a miss
            std::optional<DiskCachedTile> tile;
            try
            {
                tile = m_cache.get(request.key);
            }
            catch (const std::exception& e)
            {
                std::cerr << "DiskIoThread: Read of tile " << request.key << " failed: " << e.what() << std::endl;
            }
            if (request.onRead)
            {
                request.onRead(std::move(tile));
            }
            break;
        }
        case RequestType::Remove:
            m_cache.remove(request.key);
            break;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "DiskIoThread: Request for tile " << request.key << " failed: " << e.what() << std::endl;
    }
}
