#include "disk_tile_cache.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{
constexpr std::array<char, 4> TILE_MAGIC = {'P', 'T', 'I', 'L'};
constexpr const char* TILE_EXTENSION = ".tile";

void writeU32(uint8_t* out, uint32_t value)
{
    for (int i = 0; i < 4; ++i)
    {
        out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

uint32_t readU32(const uint8_t* in)
{
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i)
    {
        value |= static_cast<uint32_t>(in[i]) << (8 * i);
    }
    return value;
}

bool readTileFile(const std::filesystem::path& path, DiskCachedTile& tile, std::string& error)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        error = "cannot open";
        return false;
    }

    uint8_t header[DiskTileCache::HEADER_SIZE];
    if (!file.read(reinterpret_cast<char*>(header), sizeof(header)))
    {
        error = "truncated header";
        return false;
    }
    if (std::memcmp(header, TILE_MAGIC.data(), TILE_MAGIC.size()) != 0)
    {
        error = "bad magic";
        return false;
    }
    uint32_t version = readU32(header + 4);
    if (version != DiskTileCache::FORMAT_VERSION)
    {
        error = "unsupported version " + std::to_string(version);
        return false;
    }

    tile.width = readU32(header + 8);
    tile.height = readU32(header + 12);

    // The header must describe exactly the pixels that follow it
    std::error_code ec;
    uintmax_t fileSize = std::filesystem::file_size(path, ec);
    if (ec)
    {
        error = "cannot stat: " + ec.message();
        return false;
    }
    uint64_t pixelCount = static_cast<uint64_t>(tile.width) * tile.height;
    uint64_t available = fileSize - DiskTileCache::HEADER_SIZE;
    if (pixelCount > available / 4 || pixelCount * 4 != available)
    {
        error = "header size " + std::to_string(tile.width) + "x" + std::to_string(tile.height) +
                " does not match file size " + std::to_string(fileSize);
        return false;
    }

    size_t pixelBytes = static_cast<size_t>(pixelCount * 4);
    tile.pixels.resize(pixelBytes);
    if (pixelBytes > 0 && !file.read(reinterpret_cast<char*>(tile.pixels.data()), static_cast<std::streamsize>(pixelBytes)))
    {
        error = "truncated pixel data";
        return false;
    }
    return true;
}
} // namespace

DiskTileCache::DiskTileCache(const std::filesystem::path& cacheDir, size_t limitBytes)
    : m_cacheDir(cacheDir), m_index(limitBytes)
{
    std::error_code ec;
    std::filesystem::create_directories(m_cacheDir, ec);
    if (ec)
    {
        std::cerr << "DiskTileCache: Cannot create cache directory " << m_cacheDir << ": " << ec.message()
                  << std::endl;
    }
}

std::filesystem::path DiskTileCache::pathForKey(CacheKey key) const
{
    std::ostringstream name;
    name << std::hex << std::setw(16) << std::setfill('0') << key << TILE_EXTENSION;
    return m_cacheDir / name.str();
}

std::optional<CacheKey> DiskTileCache::keyFromFileName(const std::filesystem::path& path)
{
    if (path.extension() != TILE_EXTENSION)
    {
        return std::nullopt;
    }

    std::string stem = path.stem().string();
    if (stem.empty() || stem.size() > 16 ||
        !std::all_of(stem.begin(), stem.end(), [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        return std::nullopt;
    }
    return static_cast<CacheKey>(std::stoull(stem, nullptr, 16));
}

bool DiskTileCache::put(CacheKey key, const std::vector<uint8_t>& pixels, uint32_t width, uint32_t height)
{
    if (pixels.size() != static_cast<size_t>(width) * height * 4)
    {
        std::cerr << "DiskTileCache: Pixel buffer size mismatch for tile " << std::hex << key << std::dec
                  << std::endl;
        return false;
    }

    std::filesystem::path finalPath = pathForKey(key);
    std::filesystem::path tempPath = finalPath;
    tempPath += ".tmp" + std::to_string(m_tempCounter.fetch_add(1));

    uint8_t header[HEADER_SIZE];
    std::memcpy(header, TILE_MAGIC.data(), TILE_MAGIC.size());
    writeU32(header + 4, FORMAT_VERSION);
    writeU32(header + 8, width);
    writeU32(header + 12, height);

    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (file.is_open())
        {
            file.write(reinterpret_cast<const char*>(header), sizeof(header));
            file.write(reinterpret_cast<const char*>(pixels.data()), static_cast<std::streamsize>(pixels.size()));
        }
        if (!file.is_open() || !file.good())
        {
            ++m_ioErrors;
            std::cerr << "DiskTileCache: Failed to write " << tempPath << std::endl;
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec)
    {
        ++m_ioErrors;
        std::cerr << "DiskTileCache: Failed to store " << finalPath << ": " << ec.message() << std::endl;
        std::filesystem::remove(tempPath, ec);
        // The old file (if any) may be gone; forget it
        std::lock_guard<std::mutex> lock(m_mutex);
        m_index.remove(key);
        return false;
    }

    LruIndex<std::filesystem::path>::Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        evicted = m_index.insert(key, finalPath, HEADER_SIZE + pixels.size()).evicted;
    }
    deleteFiles(evicted);
    return true;
}

std::optional<DiskCachedTile> DiskTileCache::get(CacheKey key)
{
    std::filesystem::path path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::filesystem::path* indexed = m_index.peek(key);
        if (!indexed)
        {
            m_index.countMiss();
            return std::nullopt;
        }
        path = *indexed;
    }

    DiskCachedTile tile;
    tile.key = key;
    std::string error;
    bool ok = false;
    try
    {
        ok = readTileFile(path, tile, error);
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ok)
    {
        ++m_ioErrors;
        std::cerr << "DiskTileCache: Dropping unreadable tile " << path << " (" << error << ")" << std::endl;
        m_index.remove(key);
        m_index.countMiss();
        return std::nullopt;
    }

    // Counts the hit and bumps recency; a concurrent remove just counts a miss
    m_index.get(key);
    return tile;
}

bool DiskTileCache::contains(CacheKey key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.contains(key);
}

bool DiskTileCache::remove(CacheKey key)
{
    std::optional<std::filesystem::path> path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        path = m_index.remove(key);
    }
    if (!path)
    {
        return false;
    }

    std::error_code ec;
    std::filesystem::remove(*path, ec);
    if (ec)
    {
        ++m_ioErrors;
        std::cerr << "DiskTileCache: Failed to delete " << *path << ": " << ec.message() << std::endl;
    }
    return true;
}

void DiskTileCache::clear()
{
    LruIndex<std::filesystem::path>::Evicted removed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed = m_index.clear();
    }
    deleteFiles(removed);
}

void DiskTileCache::setLimit(size_t limitBytes)
{
    LruIndex<std::filesystem::path>::Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        evicted = m_index.setLimit(limitBytes);
    }
    deleteFiles(evicted);
}

size_t DiskTileCache::evictBytes(size_t bytes)
{
    LruIndex<std::filesystem::path>::Evicted evicted;
    size_t freed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t before = m_index.bytesUsed();
        evicted = m_index.evictBytes(bytes);
        freed = before - m_index.bytesUsed();
    }
    deleteFiles(evicted);
    return freed;
}

void DiskTileCache::deleteFiles(const LruIndex<std::filesystem::path>::Evicted& evicted)
{
    for (const auto& entry : evicted)
    {
        std::error_code ec;
        std::filesystem::remove(entry.second, ec);
        if (ec)
        {
            ++m_ioErrors;
            std::cerr << "DiskTileCache: Failed to delete " << entry.second << ": " << ec.message() << std::endl;
        }
    }
}

size_t DiskTileCache::loadFromDisk()
{
    struct FoundTile
    {
        CacheKey key;
        std::filesystem::path path;
        size_t size;
        std::filesystem::file_time_type modified;
    };
    std::vector<FoundTile> found;

    std::error_code ec;
    std::filesystem::directory_iterator it(m_cacheDir, ec);
    if (ec)
    {
        ++m_ioErrors;
        std::cerr << "DiskTileCache: Cannot scan " << m_cacheDir << ": " << ec.message() << std::endl;
        return 0;
    }

    for (const auto& entry : it)
    {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc))
        {
            continue;
        }
        std::optional<CacheKey> key = keyFromFileName(entry.path());
        if (!key)
        {
            continue;
        }
        uintmax_t size = entry.file_size(entryEc);
        if (entryEc)
        {
            continue;
        }
        auto modified = entry.last_write_time(entryEc);
        found.push_back({*key, entry.path(), static_cast<size_t>(size), modified});
    }

    std::sort(found.begin(), found.end(),
              [](const FoundTile& a, const FoundTile& b) { return a.modified < b.modified; });

    LruIndex<std::filesystem::path>::Evicted evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_index.clear();
        for (auto& tile : found)
        {
            auto result = m_index.insert(tile.key, tile.path, tile.size);
            for (auto& item : result.evicted)
            {
                evicted.push_back(std::move(item));
            }
        }
    }
    deleteFiles(evicted);

    std::cout << "DiskTileCache: Indexed " << found.size() << " tiles from " << m_cacheDir << std::endl;
    return found.size();
}

void DiskTileCache::recalculateDiskUsage()
{
    std::vector<std::pair<CacheKey, std::filesystem::path>> indexed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (CacheKey key : m_index.keys())
        {
            indexed.emplace_back(key, *m_index.peek(key));
        }
    }

    std::vector<std::pair<CacheKey, std::optional<size_t>>> sizes;
    sizes.reserve(indexed.size());
    for (const auto& entry : indexed)
    {
        std::error_code ec;
        uintmax_t size = std::filesystem::file_size(entry.second, ec);
        sizes.emplace_back(entry.first, ec ? std::nullopt : std::optional<size_t>(static_cast<size_t>(size)));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : sizes)
    {
        if (entry.second)
        {
            m_index.resize(entry.first, *entry.second);
        }
        else
        {
            m_index.remove(entry.first);
        }
    }
}

CacheStats DiskTileCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.stats();
}

size_t DiskTileCache::bytesUsed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.bytesUsed();
}

size_t DiskTileCache::limit() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.limit();
}
