#include "viewport_priority.h"

#include <algorithm>

PriorityCalculator::PriorityCalculator(const Viewport& viewport, uint32_t tileSize)
    : m_viewport(viewport), m_tileSize(std::max<uint32_t>(tileSize, 1))
{
}

bool PriorityCalculator::isNeighbourPage(uint16_t pageIndex) const
{
    // uint16 wrap-around matches page 0 against the last possible index
    uint16_t next = static_cast<uint16_t>(m_viewport.pageIndex + 1);
    uint16_t previous = static_cast<uint16_t>(m_viewport.pageIndex - 1);
    return pageIndex == next || pageIndex == previous;
}

JobPriority PriorityCalculator::calculateTilePriority(const TilePosition& tile) const
{
    if (tile.pageIndex != m_viewport.pageIndex || tile.zoomLevel != m_viewport.zoomLevel)
    {
        return isNeighbourPage(tile.pageIndex) ? JobPriority::Adjacent : JobPriority::Thumbnails;
    }

    float scale = static_cast<float>(std::max<uint32_t>(m_viewport.zoomLevel, 1)) / 100.0f;
    float scaledTileSize = static_cast<float>(m_tileSize) / scale;

    float tileLeft = static_cast<float>(tile.tileX) * scaledTileSize;
    float tileTop = static_cast<float>(tile.tileY) * scaledTileSize;
    float tileRight = tileLeft + scaledTileSize;
    float tileBottom = tileTop + scaledTileSize;

    float viewLeft = m_viewport.x;
    float viewTop = m_viewport.y;
    float viewRight = m_viewport.x + m_viewport.width;
    float viewBottom = m_viewport.y + m_viewport.height;

    if (tileRight > viewLeft && tileLeft < viewRight && tileBottom > viewTop && tileTop < viewBottom)
    {
        return JobPriority::Visible;
    }

    float margin = scaledTileSize * static_cast<float>(m_viewport.marginTiles);
    if (tileRight > viewLeft - margin && tileLeft < viewRight + margin && tileBottom > viewTop - margin &&
        tileTop < viewBottom + margin)
    {
        return JobPriority::Margin;
    }

    return JobPriority::Thumbnails;
}

JobPriority PriorityCalculator::calculateThumbnailPriority(uint16_t pageIndex) const
{
    if (pageIndex == m_viewport.pageIndex)
    {
        return JobPriority::Margin;
    }
    if (isNeighbourPage(pageIndex))
    {
        return JobPriority::Adjacent;
    }
    return JobPriority::Thumbnails;
}
