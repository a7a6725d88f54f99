/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Scratch Buffer Pool Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_SCRATCHPOOL_H
#define QSGPT_SCRATCHPOOL_H

#include "AlignedBuffer.h"

namespace qsgpt {

class ScratchPool;

/**
 * @brief Scoped loan of a scratch buffer
 *
 * Hands the buffer back to its pool on destruction. Leases made while
 * another lease of the same pool is outstanding own a private buffer that
 * is simply freed.
 */
class LIBQSGPT_EXPORT ScratchLease
{
public:
    ~ScratchLease();

    ScratchLease(const ScratchLease&) = delete;
    ScratchLease& operator=(const ScratchLease&) = delete;

    ScratchLease(ScratchLease&& other) noexcept;
    ScratchLease& operator=(ScratchLease&& other) = delete;

    AlignedBuffer& buffer() { return m_buffer; }
    const AlignedBuffer& buffer() const { return m_buffer; }

    quint8* data() { return m_buffer.data(); }
    int size() const { return m_buffer.size(); }

    /**
     * @brief True if the buffer goes back to the pool afterwards
     */
    bool isPooled() const { return m_pool != nullptr; }

    /**
     * @brief Failure of the buffer or of growing it to the requested size
     */
    PtStatus status() const { return m_status.ok() ? m_buffer.status() : m_status; }

private:
    friend class ScratchPool;
    ScratchLease(AlignedBuffer&& buffer, ScratchPool* pool, const PtStatus& status = PtStatus::success());

    AlignedBuffer m_buffer;
    ScratchPool* m_pool;
    PtStatus m_status;
};

/**
 * @brief Per-thread reusable scratch buffer
 *
 * Each thread owns one pool, reached through local(). The pooled buffer
 * keeps its allocation between leases so repeated commands of similar size
 * do not reallocate.
 */
class LIBQSGPT_EXPORT ScratchPool
{
public:
    static constexpr int DEFAULT_INITIAL_SIZE = 4096;

    ScratchPool();
    ~ScratchPool();

    ScratchPool(const ScratchPool&) = delete;
    ScratchPool& operator=(const ScratchPool&) = delete;

    /**
     * @brief Pool of the calling thread, created on first use
     */
    static ScratchPool& local();

    /**
     * @brief Borrow a zero-filled buffer of @p size bytes
     * @param size Logical length of the lease
     * @param alignment Start alignment (0 or a power of two)
     */
    ScratchLease acquire(int size, int alignment = 0);

    /**
     * @brief Minimum allocation made when the pooled buffer is (re)created
     */
    void setInitialSize(int size);
    int initialSize() const { return m_initialSize; }

    bool isLeased() const { return m_leased; }

    /**
     * @brief Bytes currently held by the idle pooled buffer
     */
    int pooledSize() const { return m_buffer.size(); }

private:
    friend class ScratchLease;
    void giveBack(AlignedBuffer&& buffer);

    AlignedBuffer m_buffer;
    int m_initialSize;
    bool m_leased;
    bool m_primed;          ///< Pooled buffer allocated at least once
};

} // namespace qsgpt

#endif // QSGPT_SCRATCHPOOL_H
