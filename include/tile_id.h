#ifndef TILE_ID_H
#define TILE_ID_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

constexpr uint32_t DEFAULT_TILE_SIZE = 256;
constexpr uint32_t TILE_BYTES_PER_PIXEL = 4; // RGBA8

struct TileCoordinate
{
    uint32_t x = 0;
    uint32_t y = 0;

    // 64-bit so far-out coordinates cannot wrap onto a real tile
    std::pair<uint64_t, uint64_t> toPixelOffset(uint32_t tileSize) const
    {
        return {static_cast<uint64_t>(x) * tileSize, static_cast<uint64_t>(y) * tileSize};
    }

    bool operator==(const TileCoordinate& other) const
    {
        return x == other.x && y == other.y;
    }
    bool operator!=(const TileCoordinate& other) const
    {
        return !(*this == other);
    }
};

enum class TileProfile : uint8_t
{
    Preview = 0, // Fast pass, no anti-aliasing
    Crisp = 1    // Full quality
};

const char* tileProfileName(TileProfile profile);

/**
 * @brief Mix a document fingerprint into a tile cache key
 *
 * Storage shared by several documents (the disk tier) must use scoped keys,
 * otherwise one document's tiles would answer for another's.
 */
uint64_t documentScopedKey(uint64_t cacheKey, uint64_t documentFingerprint);

/**
 * @brief Profile-independent position of a tile, used for progressive state
 */
struct TileLocation
{
    uint16_t pageIndex = 0;
    TileCoordinate coordinate;
    uint32_t zoomLevel = 100;
    uint16_t rotation = 0;

    bool operator==(const TileLocation& other) const
    {
        return pageIndex == other.pageIndex && coordinate == other.coordinate && zoomLevel == other.zoomLevel &&
               rotation == other.rotation;
    }
};

/**
 * @brief Immutable identity of one rendered tile
 */
struct TileId
{
    uint16_t pageIndex = 0;
    TileCoordinate coordinate;
    uint32_t zoomLevel = 100; // Percent
    uint16_t rotation = 0;    // Degrees
    TileProfile profile = TileProfile::Crisp;

    TileId() = default;
    TileId(uint16_t page, TileCoordinate coord, uint32_t zoom, uint16_t rot, TileProfile prof)
        : pageIndex(page), coordinate(coord), zoomLevel(zoom), rotation(rot), profile(prof)
    {
    }

    /**
     * @brief 64-bit FNV-1a over every field
     *
     * Stable across runs and platforms, so the disk tier can use it in file
     * names.
     */
    uint64_t cacheKey() const;

    /**
     * @brief cacheKey() scoped to one document, for storage shared between
     *        documents (the disk tier)
     */
    uint64_t cacheKey(uint64_t documentFingerprint) const;

    TileLocation location() const
    {
        return TileLocation{pageIndex, coordinate, zoomLevel, rotation};
    }

    TileId withProfile(TileProfile other) const
    {
        TileId copy = *this;
        copy.profile = other;
        return copy;
    }

    std::string toString() const;

    bool operator==(const TileId& other) const
    {
        return pageIndex == other.pageIndex && coordinate == other.coordinate && zoomLevel == other.zoomLevel &&
               rotation == other.rotation && profile == other.profile;
    }
    bool operator!=(const TileId& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief RGBA8 pixels of one tile, row-major, tightly packed
 */
struct RenderedTile
{
    TileId id;
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;

    size_t byteSize() const
    {
        return pixels.size();
    }

    bool isOpaque() const;
};

namespace std
{
template <>
struct hash<TileId>
{
    size_t operator()(const TileId& id) const noexcept
    {
        return static_cast<size_t>(id.cacheKey());
    }
};

template <>
struct hash<TileLocation>
{
    size_t operator()(const TileLocation& location) const noexcept
    {
        return static_cast<size_t>(TileId(location.pageIndex, location.coordinate, location.zoomLevel,
                                          location.rotation, TileProfile::Preview)
                                       .cacheKey());
    }
};
} // namespace std

#endif // TILE_ID_H
