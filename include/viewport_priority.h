#ifndef VIEWPORT_PRIORITY_H
#define VIEWPORT_PRIORITY_H

#include "job.h"

#include <cstdint>

/**
 * @brief Visible region of a page, in unzoomed page coordinates (points)
 */
struct Viewport
{
    uint16_t pageIndex = 0;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    uint32_t zoomLevel = 100;
    uint32_t marginTiles = 3; // Scroll-ahead ring around the viewport, in tiles

    Viewport() = default;
    Viewport(uint16_t page, float vx, float vy, float vw, float vh, uint32_t zoom)
        : pageIndex(page), x(vx), y(vy), width(vw), height(vh), zoomLevel(zoom)
    {
    }

    Viewport withMarginTiles(uint32_t tiles) const
    {
        Viewport copy = *this;
        copy.marginTiles = tiles;
        return copy;
    }
};

struct TilePosition
{
    uint16_t pageIndex = 0;
    uint32_t tileX = 0;
    uint32_t tileY = 0;
    uint32_t zoomLevel = 100;
};

/**
 * @brief Maps tiles and pages to scheduling priorities for a given viewport
 *
 * A tile at zoom Z covers tileSize / (Z / 100) page units, so the tile grid is
 * projected back into page space before being intersected with the viewport.
 */
class PriorityCalculator
{
public:
    PriorityCalculator(const Viewport& viewport, uint32_t tileSize);

    void updateViewport(const Viewport& viewport)
    {
        m_viewport = viewport;
    }

    const Viewport& getViewport() const
    {
        return m_viewport;
    }

    /**
     * Visible if the tile intersects the viewport, Margin if it intersects the
     * margin ring. Tiles on other pages or zoom levels are Adjacent for the
     * neighbouring pages and Thumbnails for everything else.
     */
    JobPriority calculateTilePriority(const TilePosition& tile) const;

    JobPriority calculateThumbnailPriority(uint16_t pageIndex) const;

    JobPriority calculateOcrPriority(uint16_t) const
    {
        return JobPriority::Ocr;
    }

private:
    bool isNeighbourPage(uint16_t pageIndex) const;

    Viewport m_viewport;
    uint32_t m_tileSize;
};

#endif // VIEWPORT_PRIORITY_H
