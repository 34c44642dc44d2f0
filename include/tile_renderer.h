#ifndef TILE_RENDERER_H
#define TILE_RENDERER_H

#include "tile_id.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class CancellationToken;
class Document;

/**
 * @brief Backend failure while rasterizing a tile
 */
class RenderError : public std::runtime_error
{
public:
    explicit RenderError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/**
 * @brief Page index or tile coordinate outside the document or tile grid
 */
class InvalidTileError : public std::out_of_range
{
public:
    explicit InvalidTileError(const std::string& message)
        : std::out_of_range(message)
    {
    }
};

/**
 * @brief Splits pages into a fixed-size tile grid and renders single tiles
 *
 * Tiles are tileSize x tileSize pixels of the zoomed (and rotated) page; the
 * last column and row are clipped to the page edge.
 */
class TileRenderer
{
public:
    explicit TileRenderer(uint32_t tileSize = DEFAULT_TILE_SIZE);

    uint32_t getTileSize() const
    {
        return m_tileSize;
    }

    /**
     * Compute the grid of a page
     * @param pageWidth Native page width in points
     * @param pageHeight Native page height in points
     * @param zoomLevel Zoom in percent
     * @param rotation Degrees; 90 and 270 swap width and height
     * @return (columns, rows)
     */
    std::pair<uint32_t, uint32_t> calculateTileGrid(float pageWidth, float pageHeight, uint32_t zoomLevel,
                                                    uint16_t rotation = 0) const;

    /**
     * Zoomed and rotated page size in pixels
     */
    std::pair<uint32_t, uint32_t> zoomedPageSize(float pageWidth, float pageHeight, uint32_t zoomLevel,
                                                 uint16_t rotation = 0) const;

    /**
     * Grid of a document page
     * @throws InvalidTileError for a bad page, RenderError if the page cannot be measured
     */
    std::pair<uint32_t, uint32_t> pageGrid(Document& document, uint16_t pageIndex, uint32_t zoomLevel,
                                           uint16_t rotation = 0) const;

    /**
     * Render one tile
     * @return The tile, or std::nullopt if the token was cancelled mid-render
     * @throws InvalidTileError for a bad page or coordinate
     * @throws RenderError when the backend fails
     */
    std::optional<RenderedTile> renderTile(Document& document, const TileId& tileId,
                                           const CancellationToken* token = nullptr) const;

    /**
     * Render every tile of a page, row by row
     * @throws InvalidTileError, RenderError
     */
    std::vector<RenderedTile> renderPageTiles(Document& document, uint16_t pageIndex, uint32_t zoomLevel,
                                              uint16_t rotation, TileProfile profile) const;

private:
    uint32_t m_tileSize;
};

#endif // TILE_RENDERER_H
