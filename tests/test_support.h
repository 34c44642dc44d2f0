#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "cancellation.h"
#include "document.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief In-memory document whose pixels encode the request
 *
 * Every pixel of a rendered region is (x & 0xFF, y & 0xFF, pageIndex, 0xFF)
 * in zoomed page coordinates, so tests can check which region came back.
 */
class FakeDocument : public Document
{
public:
    explicit FakeDocument(std::vector<PageSize> pages = {PageSize{612.0f, 792.0f}}, uint64_t fingerprint = 42)
        : m_pages(std::move(pages)), m_fingerprint(fingerprint)
    {
    }

    bool open(const std::string&) override
    {
        return true;
    }
    void close() override
    {
    }

    int getPageCount() const override
    {
        return static_cast<int>(m_pages.size());
    }

    PageSize getPageSize(int pageNum) override
    {
        if (pageNum < 0 || pageNum >= getPageCount())
        {
            throw std::out_of_range("page " + std::to_string(pageNum));
        }
        return m_pages[static_cast<size_t>(pageNum)];
    }

    uint64_t fingerprint() const override
    {
        return m_fingerprint;
    }

    std::optional<std::vector<uint8_t>> renderRegion(const RegionRequest& request,
                                                     const CancellationToken* token) override
    {
        ++m_renderCount;
        if (m_failRenders)
        {
            throw std::runtime_error("backend exploded");
        }

        // Simulated slow backend that polls the token
        auto deadline = std::chrono::steady_clock::now() + m_renderDelay;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (token && token->isCancelled())
            {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (token && token->isCancelled())
        {
            return std::nullopt;
        }

        std::vector<uint8_t> pixels(static_cast<size_t>(request.width) * request.height * 4);
        for (uint32_t y = 0; y < request.height; ++y)
        {
            for (uint32_t x = 0; x < request.width; ++x)
            {
                size_t offset = (static_cast<size_t>(y) * request.width + x) * 4;
                pixels[offset] = static_cast<uint8_t>((request.x + x) & 0xFF);
                pixels[offset + 1] = static_cast<uint8_t>((request.y + y) & 0xFF);
                pixels[offset + 2] = static_cast<uint8_t>(request.pageIndex & 0xFF);
                pixels[offset + 3] = 0xFF;
            }
        }
        return pixels;
    }

    void setFailRenders(bool fail)
    {
        m_failRenders = fail;
    }
    void setRenderDelay(std::chrono::milliseconds delay)
    {
        m_renderDelay = delay;
    }
    int renderCount() const
    {
        return m_renderCount.load();
    }

private:
    std::vector<PageSize> m_pages;
    uint64_t m_fingerprint;
    std::atomic<bool> m_failRenders{false};
    std::chrono::milliseconds m_renderDelay{0};
    std::atomic<int> m_renderCount{0};
};

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDir
{
public:
    TempDir()
    {
        std::random_device device;
        std::mt19937_64 generator(device());
        m_path = std::filesystem::temp_directory_path() / ("pagetiler-test-" + std::to_string(generator()));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

inline std::vector<uint8_t> solidPixels(uint32_t width, uint32_t height, uint8_t value = 0x80)
{
    return std::vector<uint8_t>(static_cast<size_t>(width) * height * 4, value);
}

#endif // TEST_SUPPORT_H
