#include "mupdf_locking.h"

#include <array>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace
{
class LockTable
{
public:
    LockTable() = default;
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;

    static void lock(void* user, int lockIndex)
    {
        if (auto* mutex = slot(user, lockIndex))
        {
            mutex->lock();
        }
    }

    static void unlock(void* user, int lockIndex)
    {
        if (auto* mutex = slot(user, lockIndex))
        {
            mutex->unlock();
        }
    }

private:
    static std::mutex* slot(void* user, int lockIndex)
    {
        if (!user || lockIndex < 0 || lockIndex >= FZ_LOCK_MAX)
        {
            return nullptr;
        }
        return &static_cast<LockTable*>(user)->m_mutexes[static_cast<size_t>(lockIndex)];
    }

    std::array<std::mutex, FZ_LOCK_MAX> m_mutexes;
};
} // namespace

const fz_locks_context* getSharedMuPdfLocks()
{
    static LockTable table;
    static const fz_locks_context locksContext{&table, &LockTable::lock, &LockTable::unlock};
    return &locksContext;
}

fz_context* createSharedMuPdfContext(size_t storeSize)
{
    fz_context* ctx = fz_new_context(nullptr, getSharedMuPdfLocks(), storeSize);
    if (!ctx)
    {
        throw std::runtime_error("Cannot create MuPDF context");
    }

    fz_try(ctx)
    {
        fz_register_document_handlers(ctx);
    }
    fz_catch(ctx)
    {
        std::cerr << "MuPdfLocking: Cannot register document handlers: " << fz_caught_message(ctx) << std::endl;
    }
    return ctx;
}

fz_context* cloneMuPdfContext(fz_context* base)
{
    if (!base)
    {
        throw std::invalid_argument("Cannot clone a null MuPDF context");
    }

    fz_context* clone = fz_clone_context(base);
    if (!clone)
    {
        throw std::runtime_error("Cannot clone MuPDF context");
    }
    return clone;
}
