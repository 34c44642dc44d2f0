#ifndef MUPDF_LOCKING_H
#define MUPDF_LOCKING_H

#include <cstddef>
#include <mupdf/fitz.h>

/**
 * @brief Returns the process-wide MuPDF lock table.
 *
 * Tile workers render on contexts cloned from a document's base context, and
 * the resource store and glyph cache are shared between all of them. Every
 * context that may run concurrently must therefore use this one table.
 */
const fz_locks_context* getSharedMuPdfLocks();

/**
 * @brief Create a base context wired to the shared lock table with the
 *        document handlers registered.
 * @throws std::runtime_error if MuPDF cannot allocate the context
 */
fz_context* createSharedMuPdfContext(size_t storeSize);

/**
 * @brief Clone a base context for use on another thread.
 * @throws std::runtime_error if the clone fails
 */
fz_context* cloneMuPdfContext(fz_context* base);

#endif // MUPDF_LOCKING_H
