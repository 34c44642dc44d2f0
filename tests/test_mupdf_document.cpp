#include "mupdf_document.h"
#include "test_support.h"
#include "tile_renderer.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace
{
// Two 200 x 100 pt pages; the left half of each is filled black
std::string buildTestPdf()
{
    const std::string content = "0 0 0 rg 0 0 100 100 re f\n";

    std::vector<std::string> objects;
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>");
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 200 100] /Contents 5 0 R >>");
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 200 100] /Contents 5 0 R >>");
    objects.push_back("<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content + "endstream");

    std::ostringstream pdf;
    pdf << "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i)
    {
        offsets.push_back(static_cast<size_t>(pdf.tellp()));
        pdf << (i + 1) << " 0 obj\n" << objects[i] << "\nendobj\n";
    }

    size_t xrefOffset = static_cast<size_t>(pdf.tellp());
    pdf << "xref\n0 " << objects.size() + 1 << "\n";
    pdf << "0000000000 65535 f \n";
    for (size_t offset : offsets)
    {
        char line[21];
        std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offset);
        pdf << line;
    }
    pdf << "trailer\n<< /Size " << objects.size() + 1 << " /Root 1 0 R >>\n";
    pdf << "startxref\n" << xrefOffset << "\n%%EOF\n";
    return pdf.str();
}

class MuPdfDocumentTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_path = m_dir.path() / "sample.pdf";
        std::ofstream file(m_path, std::ios::binary);
        file << buildTestPdf();
        file.close();
        ASSERT_TRUE(m_document.open(m_path.string()));
    }

    TempDir m_dir;
    std::filesystem::path m_path;
    MuPdfDocument m_document;
};

uint8_t redAt(const std::vector<uint8_t>& pixels, uint32_t width, uint32_t x, uint32_t y)
{
    return pixels[(static_cast<size_t>(y) * width + x) * 4];
}
} // namespace

TEST_F(MuPdfDocumentTest, ReportsPagesAndSizes)
{
    EXPECT_EQ(m_document.getPageCount(), 2);
    PageSize size = m_document.getPageSize(1);
    EXPECT_FLOAT_EQ(size.width, 200.0f);
    EXPECT_FLOAT_EQ(size.height, 100.0f);
    EXPECT_THROW(m_document.getPageSize(2), std::out_of_range);
    EXPECT_NE(m_document.fingerprint(), 0u);
}

TEST_F(MuPdfDocumentTest, RendersRegionPixels)
{
    RegionRequest request;
    request.pageIndex = 0;
    request.width = 200;
    request.height = 100;

    std::optional<std::vector<uint8_t>> pixels = m_document.renderRegion(request, nullptr);
    ASSERT_TRUE(pixels.has_value());
    ASSERT_EQ(pixels->size(), 200u * 100u * 4u);

    EXPECT_EQ(redAt(*pixels, 200, 20, 50), 0x00);
    EXPECT_EQ(redAt(*pixels, 200, 180, 50), 0xFF);
    EXPECT_EQ((*pixels)[3], 0xFF);
}

TEST_F(MuPdfDocumentTest, RegionOffsetSelectsPartOfThePage)
{
    RegionRequest request;
    request.pageIndex = 0;
    request.zoomLevel = 200;
    request.x = 200;
    request.width = 200;
    request.height = 200;
    request.profile = TileProfile::Preview;

    std::optional<std::vector<uint8_t>> pixels = m_document.renderRegion(request, nullptr);
    ASSERT_TRUE(pixels.has_value());
    // Right half of the zoomed page is blank
    EXPECT_EQ(redAt(*pixels, 200, 10, 10), 0xFF);
    EXPECT_EQ(redAt(*pixels, 200, 190, 190), 0xFF);
}

TEST_F(MuPdfDocumentTest, RotationMovesTheFilledHalf)
{
    RegionRequest request;
    request.pageIndex = 0;
    request.rotation = 90;
    request.width = 100;
    request.height = 200;

    std::optional<std::vector<uint8_t>> pixels = m_document.renderRegion(request, nullptr);
    ASSERT_TRUE(pixels.has_value());
    // A quarter turn clockwise puts the left half on top
    EXPECT_EQ(redAt(*pixels, 100, 50, 20), 0x00);
    EXPECT_EQ(redAt(*pixels, 100, 50, 180), 0xFF);
}

TEST_F(MuPdfDocumentTest, CancelledTokenStopsRender)
{
    CancellationToken token;
    token.cancel();

    RegionRequest request;
    request.width = 200;
    request.height = 100;
    EXPECT_FALSE(m_document.renderRegion(request, &token).has_value());
}

TEST_F(MuPdfDocumentTest, RejectsBadRequests)
{
    RegionRequest request;
    request.pageIndex = 5;
    request.width = 10;
    request.height = 10;
    EXPECT_THROW(m_document.renderRegion(request, nullptr), std::out_of_range);

    request.pageIndex = 0;
    request.width = 0;
    EXPECT_THROW(m_document.renderRegion(request, nullptr), std::invalid_argument);
}

TEST_F(MuPdfDocumentTest, OversizedRegionFailsCleanly)
{
    RegionRequest request;
    request.width = 0x7FFFFFFF;
    request.height = 0x7FFFFFFF;
    EXPECT_THROW(m_document.renderRegion(request, nullptr), std::length_error);

    // The document still renders afterwards
    request.width = 200;
    request.height = 100;
    std::optional<std::vector<uint8_t>> pixels = m_document.renderRegion(request, nullptr);
    ASSERT_TRUE(pixels.has_value());
    EXPECT_EQ(pixels->size(), 200u * 100u * 4u);
}

TEST_F(MuPdfDocumentTest, TilesRenderConcurrently)
{
    TileRenderer renderer(64);
    auto [columns, rows] = renderer.pageGrid(m_document, 1, 100);
    ASSERT_EQ(columns, 4u);
    ASSERT_EQ(rows, 2u);

    std::vector<std::thread> threads;
    std::vector<std::optional<RenderedTile>> results(columns * rows);
    for (uint32_t y = 0; y < rows; ++y)
    {
        for (uint32_t x = 0; x < columns; ++x)
        {
            threads.emplace_back(
                [&, x, y]()
                {
                    TileId id(1, TileCoordinate{x, y}, 100, 0, TileProfile::Crisp);
                    results[y * columns + x] = renderer.renderTile(m_document, id);
                });
        }
    }
    for (std::thread& thread : threads)
    {
        thread.join();
    }

    for (const auto& tile : results)
    {
        ASSERT_TRUE(tile.has_value());
        EXPECT_EQ(tile->pixels.size(), static_cast<size_t>(tile->width) * tile->height * 4);
    }
    EXPECT_EQ(results[0]->width, 64u);
    EXPECT_EQ(results[3]->width, 8u);
    EXPECT_EQ(results[4]->height, 36u);
}

TEST(MuPdfDocument, OpenFailsForMissingFile)
{
    MuPdfDocument document;
    EXPECT_FALSE(document.open("/nonexistent/file.pdf"));
    EXPECT_EQ(document.getPageCount(), 0);
}
