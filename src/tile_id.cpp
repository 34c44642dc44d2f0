#include "tile_id.h"

#include <sstream>

namespace
{
constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

// Little-endian byte order keeps keys identical across hosts
template <typename T>
void fnvMix(uint64_t& hash, T value)
{
    for (size_t i = 0; i < sizeof(T); ++i)
    {
        hash ^= static_cast<uint8_t>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF);
        hash *= FNV_PRIME;
    }
}
} // namespace

const char* tileProfileName(TileProfile profile)
{
    return profile == TileProfile::Preview ? "preview" : "crisp";
}

uint64_t documentScopedKey(uint64_t cacheKey, uint64_t documentFingerprint)
{
    uint64_t hash = FNV_OFFSET_BASIS;
    fnvMix(hash, cacheKey);
    fnvMix(hash, documentFingerprint);
    return hash;
}

uint64_t TileId::cacheKey() const
{
    uint64_t hash = FNV_OFFSET_BASIS;
    fnvMix(hash, pageIndex);
    fnvMix(hash, coordinate.x);
    fnvMix(hash, coordinate.y);
    fnvMix(hash, zoomLevel);
    fnvMix(hash, rotation);
    fnvMix(hash, static_cast<uint8_t>(profile));
    return hash;
}

uint64_t TileId::cacheKey(uint64_t documentFingerprint) const
{
    return documentScopedKey(cacheKey(), documentFingerprint);
}

std::string TileId::toString() const
{
    std::ostringstream oss;
    oss << "page " << pageIndex << " tile (" << coordinate.x << "," << coordinate.y << ") zoom " << zoomLevel
        << "% rot " << rotation << " " << tileProfileName(profile);
    return oss.str();
}

bool RenderedTile::isOpaque() const
{
    for (size_t i = 3; i < pixels.size(); i += TILE_BYTES_PER_PIXEL)
    {
        if (pixels[i] != 0xFF)
        {
            return false;
        }
    }
    return true;
}
