#include "mupdf_document.h"
#include "cancellation.h"
#include "mupdf_locking.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace
{
constexpr size_t MUPDF_STORE_SIZE = 256 << 20; // 256MB
constexpr int AA_LEVEL_OFF = 0;
constexpr int AA_LEVEL_FULL = 8;

uint64_t fingerprintFor(const std::string& filePath, int pageCount)
{
    uint64_t hash = 0xcbf29ce484222325ULL;
    auto mix = [&hash](uint8_t byte)
    {
        hash ^= byte;
        hash *= 0x100000001b3ULL;
    };

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(filePath, ec);
    const std::string key = ec ? filePath : absolute.string();
    for (char c : key)
    {
        mix(static_cast<uint8_t>(c));
    }

    uintmax_t fileSize = std::filesystem::file_size(filePath, ec);
    if (ec)
    {
        fileSize = 0;
    }
    for (int i = 0; i < 8; ++i)
    {
        mix(static_cast<uint8_t>((static_cast<uint64_t>(fileSize) >> (8 * i)) & 0xFF));
    }
    for (int i = 0; i < 4; ++i)
    {
        mix(static_cast<uint8_t>((static_cast<uint32_t>(pageCount) >> (8 * i)) & 0xFF));
    }
    return hash;
}

std::string describeMuPdfError(fz_context* ctx, const std::string& message)
{
    std::string result = message;
    const char* muErr = fz_caught_message(ctx);
    if (muErr && strlen(muErr) > 0)
    {
        result += ": ";
        result += muErr;
    }
    return result;
}
} // namespace

MuPdfDocument::MuPdfDocument()
    : Document(), m_ctx(createSharedMuPdfContext(MUPDF_STORE_SIZE))
{
}

MuPdfDocument::~MuPdfDocument()
{
    close();
}

bool MuPdfDocument::open(const std::string& filePath)
{
    close();

    std::lock_guard<std::mutex> docLock(m_docMutex);
    fz_context* ctx = m_ctx.get();

    fz_document* doc = nullptr;
    int pageCount = 0;
    fz_var(doc);

    fz_try(ctx)
    {
        doc = fz_open_document(ctx, filePath.c_str());
        pageCount = fz_count_pages(ctx, doc);
    }
    fz_catch(ctx)
    {
        if (doc)
            fz_drop_document(ctx, doc);
        std::cerr << "MuPdfDocument: " << describeMuPdfError(ctx, "Failed to open document " + filePath) << std::endl;
        return false;
    }

    m_doc = std::unique_ptr<fz_document, DocumentDeleter>(doc, DocumentDeleter{ctx});
    m_pageCount = pageCount;
    m_filePath = filePath;
    m_fingerprint = fingerprintFor(filePath, pageCount);

    {
        std::lock_guard<std::mutex> dataLock(m_pageDataMutex);
        m_pageDisplayData.clear();
        m_pageDisplayData.resize(static_cast<size_t>(pageCount));
    }

    std::cout << "MuPdfDocument: Opened " << filePath << " (" << pageCount << " pages)" << std::endl;
    return true;
}

void MuPdfDocument::close()
{
    std::lock_guard<std::mutex> docLock(m_docMutex);
    resetDisplayCache();
    m_doc.reset();
    m_pageCount = 0;
    m_fingerprint = 0;
    m_filePath.clear();
}

int MuPdfDocument::getPageCount() const
{
    return m_pageCount;
}

uint64_t MuPdfDocument::fingerprint() const
{
    return m_fingerprint;
}

void MuPdfDocument::checkPageIndex(int pageNumber) const
{
    if (pageNumber < 0 || pageNumber >= m_pageCount)
    {
        throw std::out_of_range("Invalid page number: " + std::to_string(pageNumber));
    }
}

PageSize MuPdfDocument::getPageSize(int pageNumber)
{
    checkPageIndex(pageNumber);
    ensureDisplayList(pageNumber);

    std::lock_guard<std::mutex> dataLock(m_pageDataMutex);
    const fz_rect& bounds = m_pageDisplayData[static_cast<size_t>(pageNumber)].bounds;
    return PageSize{bounds.x1 - bounds.x0, bounds.y1 - bounds.y0};
}

void MuPdfDocument::resetDisplayCache()
{
    std::lock_guard<std::mutex> dataLock(m_pageDataMutex);
    m_pageDisplayData.clear();
}

void MuPdfDocument::ensureDisplayList(int pageNumber)
{
    {
        std::lock_guard<std::mutex> dataLock(m_pageDataMutex);
        if (pageNumber >= 0 && pageNumber < static_cast<int>(m_pageDisplayData.size()) &&
            m_pageDisplayData[static_cast<size_t>(pageNumber)].displayList)
        {
            return;
        }
    }

    std::lock_guard<std::mutex> docLock(m_docMutex);

    fz_context* ctx = m_ctx.get();
    fz_document* doc = m_doc.get();
    if (!ctx || !doc)
    {
        throw std::runtime_error("Document not open");
    }

    fz_page* page = nullptr;
    fz_display_list* list = nullptr;
    fz_device* device = nullptr;
    fz_rect bounds{};
    fz_var(page);
    fz_var(list);
    fz_var(device);

    fz_try(ctx)
    {
        page = fz_load_page(ctx, doc, pageNumber);
        bounds = fz_bound_page(ctx, page);

        list = fz_new_display_list(ctx, bounds);
        device = fz_new_list_device(ctx, list);

        fz_run_page(ctx, page, device, fz_identity, nullptr);
        fz_close_device(ctx, device);
        fz_drop_device(ctx, device);
        device = nullptr;

        fz_drop_page(ctx, page);
        page = nullptr;
    }
    fz_catch(ctx)
    {
        if (device)
            fz_drop_device(ctx, device);
        if (list)
            fz_drop_display_list(ctx, list);
        if (page)
            fz_drop_page(ctx, page);

        throw std::runtime_error(
            describeMuPdfError(ctx, "Failed to build display list for page " + std::to_string(pageNumber)));
    }

    std::unique_ptr<fz_display_list, DisplayListDeleter> listPtr(list, DisplayListDeleter{ctx});

    {
        std::lock_guard<std::mutex> dataLock(m_pageDataMutex);
        if (pageNumber >= static_cast<int>(m_pageDisplayData.size()))
        {
            m_pageDisplayData.resize(static_cast<size_t>(m_pageCount));
        }

        auto& entry = m_pageDisplayData[static_cast<size_t>(pageNumber)];
        if (!entry.displayList)
        {
            entry.displayList = std::move(listPtr);
            entry.bounds = bounds;
        }
    }
}

MuPdfDocument::PageSnapshot MuPdfDocument::acquirePage(int pageNumber)
{
    ensureDisplayList(pageNumber);

    std::lock_guard<std::mutex> dataLock(m_pageDataMutex);
    if (pageNumber >= static_cast<int>(m_pageDisplayData.size()) ||
        !m_pageDisplayData[static_cast<size_t>(pageNumber)].displayList)
    {
        throw std::runtime_error("Display list missing for page " + std::to_string(pageNumber));
    }

    const auto& entry = m_pageDisplayData[static_cast<size_t>(pageNumber)];
    PageSnapshot snapshot;
    // Own reference so close() cannot free the list mid-render
    snapshot.displayList = fz_keep_display_list(m_ctx.get(), entry.displayList.get());
    snapshot.bounds = entry.bounds;
    return snapshot;
}

std::optional<std::vector<uint8_t>> MuPdfDocument::renderRegion(const RegionRequest& request,
                                                                const CancellationToken* token)
{
    checkPageIndex(request.pageIndex);
    if (request.width == 0 || request.height == 0)
    {
        throw std::invalid_argument("Empty render region for page " + std::to_string(request.pageIndex));
    }

    if (token && token->isCancelled())
    {
        return std::nullopt;
    }

    PageSnapshot page = acquirePage(request.pageIndex);

    fz_context* ctx = nullptr;
    try
    {
        ctx = cloneMuPdfContext(m_ctx.get());
    }
    catch (const std::exception&)
    {
        fz_drop_display_list(m_ctx.get(), page.displayList);
        throw;
    }
    std::unique_ptr<fz_context, ContextDeleter> renderCtx(ctx);
    std::unique_ptr<fz_display_list, DisplayListDeleter> listRef(page.displayList, DisplayListDeleter{ctx});

    fz_set_aa_level(ctx, request.profile == TileProfile::Preview ? AA_LEVEL_OFF : AA_LEVEL_FULL);

    // Scale, rotate, then move the rotated page's top-left to the origin
    float scale = std::max<uint32_t>(request.zoomLevel, 1) / 100.0f;
    fz_matrix transform = fz_pre_rotate(fz_scale(scale, scale), static_cast<float>(request.rotation));
    fz_rect pageRect = fz_transform_rect(page.bounds, transform);
    transform = fz_concat(transform, fz_translate(-pageRect.x0, -pageRect.y0));

    fz_irect region;
    region.x0 = static_cast<int>(request.x);
    region.y0 = static_cast<int>(request.y);
    region.x1 = static_cast<int>(request.x + request.width);
    region.y1 = static_cast<int>(request.y + request.height);

    fz_pixmap* pix = nullptr;
    fz_device* dev = nullptr;
    bool cancelled = false;
    fz_var(pix);
    fz_var(dev);
    fz_var(cancelled);

    // Allocated up front; a C++ throw must not cross the fz_try frame
    const size_t rowBytes = static_cast<size_t>(request.width) * TILE_BYTES_PER_PIXEL;
    std::vector<uint8_t> buffer(rowBytes * request.height);

    fz_try(ctx)
    {
        pix = fz_new_pixmap_with_bbox(ctx, fz_device_rgb(ctx), region, nullptr, 1);
        fz_clear_pixmap_with_value(ctx, pix, 0xFF);

        for (int bandTop = region.y0; bandTop < region.y1; bandTop += m_bandHeight)
        {
            if (token && token->isCancelled())
            {
                cancelled = true;
                break;
            }

            fz_irect band = region;
            band.y0 = bandTop;
            band.y1 = std::min(bandTop + m_bandHeight, region.y1);

            dev = fz_new_draw_device_with_bbox(ctx, fz_identity, pix, &band);
            fz_run_display_list(ctx, listRef.get(), dev, transform, fz_rect_from_irect(band), nullptr);
            fz_close_device(ctx, dev);
            fz_drop_device(ctx, dev);
            dev = nullptr;
        }

        if (!cancelled)
        {
            const size_t height = request.height;
            const size_t stride = static_cast<size_t>(fz_pixmap_stride(ctx, pix));
            const unsigned char* samples = fz_pixmap_samples(ctx, pix);

            for (size_t row = 0; row < height; ++row)
            {
                memcpy(buffer.data() + row * rowBytes, samples + row * stride, rowBytes);
            }
        }

        fz_drop_pixmap(ctx, pix);
        pix = nullptr;
    }
    fz_catch(ctx)
    {
        if (dev)
            fz_drop_device(ctx, dev);
        if (pix)
            fz_drop_pixmap(ctx, pix);

        std::string message = describeMuPdfError(ctx, "Error rendering page " + std::to_string(request.pageIndex));
        std::cerr << "MuPdfDocument: " << message << std::endl;
        throw std::runtime_error(message);
    }

    if (cancelled)
    {
        return std::nullopt;
    }
    return buffer;
}
