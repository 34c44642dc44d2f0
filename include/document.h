#ifndef DOCUMENT_H
#define DOCUMENT_H

#include "tile_id.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;

/**
 * @brief Native page size in points (1/72 inch), before zoom and rotation
 */
struct PageSize
{
    float width = 0.0f;
    float height = 0.0f;
};

/**
 * @brief Pixel rectangle of a zoomed and rotated page to rasterize
 *
 * x/y/width/height are in device pixels of the page rendered at zoomLevel and
 * rotated by rotation degrees, with the rotated page's top-left at (0, 0).
 */
struct RegionRequest
{
    uint16_t pageIndex = 0;
    uint32_t zoomLevel = 100;
    uint16_t rotation = 0;
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    TileProfile profile = TileProfile::Crisp;
};

class Document
{
public:
    // Lifecycle
    virtual bool open(const std::string& filename) = 0;
    virtual void close() = 0;

    virtual int getPageCount() const = 0;

    // Throws std::out_of_range for a bad page index
    virtual PageSize getPageSize(int pageNum) = 0;

    // Stable identity of the open document, used to key shared previews
    virtual uint64_t fingerprint() const = 0;

    // Renders a region and returns RGBA8 pixel data (4 bytes per pixel,
    // width * height pixels). Returns std::nullopt when the token is cancelled
    // part-way through. Throws std::runtime_error on backend failure.
    virtual std::optional<std::vector<uint8_t>> renderRegion(const RegionRequest& request,
                                                             const CancellationToken* token) = 0;

    virtual ~Document() = default;
};

#endif // DOCUMENT_H
