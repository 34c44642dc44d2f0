#ifndef MUPDF_DOCUMENT_H
#define MUPDF_DOCUMENT_H

#include "document.h"
#include <memory>
#include <mupdf/fitz.h>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Document backend using the MuPDF library
 *
 * Each page is recorded once into a display list with the main context. Tile
 * renders then replay that list on a context cloned per render, so any number
 * of worker threads can rasterize regions concurrently. All contexts share
 * the process-wide lock table from getSharedMuPdfLocks().
 *
 * Preview renders with anti-aliasing disabled; crisp renders use full
 * anti-aliasing. Regions are drawn in horizontal bands and the cancellation
 * token is polled between bands.
 */
class MuPdfDocument : public Document
{
public:
    MuPdfDocument();
    ~MuPdfDocument() override;

    bool open(const std::string& filePath) override;
    void close() override;

    int getPageCount() const override;
    PageSize getPageSize(int pageNum) override;
    uint64_t fingerprint() const override;

    std::optional<std::vector<uint8_t>> renderRegion(const RegionRequest& request,
                                                     const CancellationToken* token) override;

    // Rows rasterized between two cancellation checks
    void setBandHeight(int rows)
    {
        m_bandHeight = rows > 0 ? rows : 1;
    }

    int getBandHeight() const
    {
        return m_bandHeight;
    }

private:
    struct ContextDeleter
    {
        void operator()(fz_context* ctx) const
        {
            if (ctx)
                fz_drop_context(ctx);
        }
    };
    struct DocumentDeleter
    {
        fz_context* ctx = nullptr;
        DocumentDeleter() noexcept = default;
        DocumentDeleter(fz_context* c) noexcept : ctx(c)
        {
        }
        void operator()(fz_document* doc) const
        {
            if (doc && ctx)
                fz_drop_document(ctx, doc);
        }
    };
    struct DisplayListDeleter
    {
        fz_context* ctx;
        DisplayListDeleter() noexcept : ctx(nullptr)
        {
        }
        explicit DisplayListDeleter(fz_context* context) noexcept : ctx(context)
        {
        }
        void operator()(fz_display_list* list) const
        {
            if (list)
                fz_drop_display_list(ctx, list);
        }
    };

    struct PageDisplayData
    {
        std::unique_ptr<fz_display_list, DisplayListDeleter> displayList;
        fz_rect bounds{};
    };

    // A display list reference kept alive for the duration of one render
    struct PageSnapshot
    {
        fz_display_list* displayList{nullptr};
        fz_rect bounds{};
    };

    void ensureDisplayList(int pageNumber);
    PageSnapshot acquirePage(int pageNumber);
    void resetDisplayCache();
    void checkPageIndex(int pageNumber) const;

    std::unique_ptr<fz_context, ContextDeleter> m_ctx;
    std::unique_ptr<fz_document, DocumentDeleter> m_doc;

    std::mutex m_docMutex; // Serializes m_ctx / m_doc use
    std::mutex m_pageDataMutex;
    std::vector<PageDisplayData> m_pageDisplayData;

    int m_pageCount = 0;
    uint64_t m_fingerprint = 0;
    std::string m_filePath;
    int m_bandHeight = 64;
};

#endif // MUPDF_DOCUMENT_H
