#ifndef DISK_IO_THREAD_H
#define DISK_IO_THREAD_H

#include "disk_tile_cache.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

/**
 * @brief Runs disk tier requests on one dedicated thread, in FIFO order
 *
 * Render workers and the UI thread only enqueue; they never wait on the file
 * system. Read results are delivered through a callback on the I/O thread.
 */
class DiskIoThread
{
public:
    using ReadCallback = std::function<void(std::optional<DiskCachedTile>)>;
    using WriteCallback = std::function<void(bool)>;

    explicit DiskIoThread(DiskTileCache& cache);
    ~DiskIoThread();

    DiskIoThread(const DiskIoThread&) = delete;
    DiskIoThread& operator=(const DiskIoThread&) = delete;

    void start();

    /**
     * Stop the thread. Requests still queued are executed first unless
     * discardPending is true.
     */
    void stop(bool discardPending = false);

    bool isRunning() const
    {
        return m_running;
    }

    void write(CacheKey key, std::vector<uint8_t> pixels, uint32_t width, uint32_t height,
               WriteCallback onDone = WriteCallback());
    void read(CacheKey key, ReadCallback onDone);
    void remove(CacheKey key);

    // Block until every request queued so far has been executed
    void flush();

    size_t pendingRequests() const;

    uint64_t completedRequests() const
    {
        return m_completed.load();
    }

private:
    enum class RequestType
    {
        Write,
        Read,
        Remove
    };

    struct Request
    {
        RequestType type;
        CacheKey key = 0;
        std::vector<uint8_t> pixels;
        uint32_t width = 0;
        uint32_t height = 0;
        ReadCallback onRead;
        WriteCallback onWrite;
    };

    void enqueue(Request request);
    void ioWorker();
    void execute(Request& request);

    DiskTileCache& m_cache;
    std::thread m_workerThread;
    std::deque<Request> m_queue;
    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::condition_variable m_idleCondition;
    std::atomic<bool> m_running{false};
    bool m_busy = false;
    std::atomic<uint64_t> m_completed{0};
};

#endif // DISK_IO_THREAD_H
