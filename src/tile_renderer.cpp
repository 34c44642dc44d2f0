#include "tile_renderer.h"
#include "cancellation.h"
#include "document.h"

#include <algorithm>
#include <sstream>

namespace
{
bool swapsAxes(uint16_t rotation)
{
    return (rotation % 180) == 90;
}

uint32_t divCeil(uint32_t value, uint32_t divisor)
{
    return (value + divisor - 1) / divisor;
}
} // namespace

TileRenderer::TileRenderer(uint32_t tileSize)
    : m_tileSize(tileSize)
{
    if (m_tileSize == 0)
    {
        throw std::invalid_argument("Tile size must be positive");
    }
}

std::pair<uint32_t, uint32_t> TileRenderer::zoomedPageSize(float pageWidth, float pageHeight, uint32_t zoomLevel,
                                                           uint16_t rotation) const
{
    if (swapsAxes(rotation))
    {
        std::swap(pageWidth, pageHeight);
    }

    float factor = static_cast<float>(zoomLevel) / 100.0f;
    auto width = static_cast<uint32_t>(std::max(0.0f, pageWidth * factor));
    auto height = static_cast<uint32_t>(std::max(0.0f, pageHeight * factor));
    return {width, height};
}

std::pair<uint32_t, uint32_t> TileRenderer::calculateTileGrid(float pageWidth, float pageHeight, uint32_t zoomLevel,
                                                              uint16_t rotation) const
{
    auto [width, height] = zoomedPageSize(pageWidth, pageHeight, zoomLevel, rotation);
    return {divCeil(width, m_tileSize), divCeil(height, m_tileSize)};
}

std::optional<RenderedTile> TileRenderer::renderTile(Document& document, const TileId& tileId,
                                                     const CancellationToken* token) const
{
    if (static_cast<int>(tileId.pageIndex) >= document.getPageCount())
    {
        std::ostringstream oss;
        oss << "Page " << tileId.pageIndex << " out of range (document has " << document.getPageCount()
            << " pages)";
        throw InvalidTileError(oss.str());
    }

    PageSize size;
    try
    {
        size = document.getPageSize(tileId.pageIndex);
    }
    catch (const std::out_of_range& e)
    {
        throw InvalidTileError(e.what());
    }
    catch (const std::exception& e)
    {
        throw RenderError(std::string("Cannot measure page: ") + e.what());
    }

    auto [renderWidth, renderHeight] = zoomedPageSize(size.width, size.height, tileId.zoomLevel, tileId.rotation);
    auto [offsetX, offsetY] = tileId.coordinate.toPixelOffset(m_tileSize);

    uint32_t tileWidth =
        offsetX < renderWidth ? std::min(m_tileSize, renderWidth - static_cast<uint32_t>(offsetX)) : 0;
    uint32_t tileHeight =
        offsetY < renderHeight ? std::min(m_tileSize, renderHeight - static_cast<uint32_t>(offsetY)) : 0;
    if (tileWidth == 0 || tileHeight == 0)
    {
        std::ostringstream oss;
        oss << "Tile coordinate (" << tileId.coordinate.x << ", " << tileId.coordinate.y
            << ") is out of bounds for page " << tileId.pageIndex << " at zoom " << tileId.zoomLevel << "%";
        throw InvalidTileError(oss.str());
    }

    RegionRequest request;
    request.pageIndex = tileId.pageIndex;
    request.zoomLevel = tileId.zoomLevel;
    request.rotation = tileId.rotation;
    request.x = static_cast<uint32_t>(offsetX);
    request.y = static_cast<uint32_t>(offsetY);
    request.width = tileWidth;
    request.height = tileHeight;
    request.profile = tileId.profile;

    std::optional<std::vector<uint8_t>> pixels;
    try
    {
        pixels = document.renderRegion(request, token);
    }
    catch (const std::out_of_range& e)
    {
        throw InvalidTileError(e.what());
    }
    catch (const std::exception& e)
    {
        throw RenderError(e.what());
    }

    if (!pixels)
    {
        return std::nullopt;
    }

    size_t expected = static_cast<size_t>(tileWidth) * tileHeight * TILE_BYTES_PER_PIXEL;
    if (pixels->size() != expected)
    {
        std::ostringstream oss;
        oss << "Backend returned " << pixels->size() << " bytes for " << tileId.toString() << ", expected "
            << expected;
        throw RenderError(oss.str());
    }

    RenderedTile tile;
    tile.id = tileId;
    tile.pixels = std::move(*pixels);
    tile.width = tileWidth;
    tile.height = tileHeight;
    return tile;
}

std::pair<uint32_t, uint32_t> TileRenderer::pageGrid(Document& document, uint16_t pageIndex, uint32_t zoomLevel,
                                                     uint16_t rotation) const
{
    if (static_cast<int>(pageIndex) >= document.getPageCount())
    {
        throw InvalidTileError("Page " + std::to_string(pageIndex) + " out of range");
    }

    PageSize size;
    try
    {
        size = document.getPageSize(pageIndex);
    }
    catch (const std::out_of_range& e)
    {
        throw InvalidTileError(e.what());
    }
    catch (const std::exception& e)
    {
        throw RenderError(std::string("Cannot measure page: ") + e.what());
    }
    return calculateTileGrid(size.width, size.height, zoomLevel, rotation);
}

std::vector<RenderedTile> TileRenderer::renderPageTiles(Document& document, uint16_t pageIndex, uint32_t zoomLevel,
                                                        uint16_t rotation, TileProfile profile) const
{
    auto [columns, rows] = pageGrid(document, pageIndex, zoomLevel, rotation);

    std::vector<RenderedTile> tiles;
    tiles.reserve(static_cast<size_t>(columns) * rows);
    for (uint32_t y = 0; y < rows; ++y)
    {
        for (uint32_t x = 0; x < columns; ++x)
        {
            TileId id(pageIndex, TileCoordinate{x, y}, zoomLevel, rotation, profile);
            std::optional<RenderedTile> tile = renderTile(document, id);
            if (tile)
            {
                tiles.push_back(std::move(*tile));
            }
        }
    }
    return tiles;
}
