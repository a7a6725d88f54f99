/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Scratch Buffer Pool Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "ScratchPool.h"
#include "../util/Logger.h"

#include <QThreadStorage>

#include <utility>

namespace qsgpt {

// =============================================================================
// ScratchLease
// =============================================================================

ScratchLease::ScratchLease(AlignedBuffer&& buffer, ScratchPool* pool, const PtStatus& status)
    : m_buffer(std::move(buffer))
    , m_pool(pool)
    , m_status(status)
{
}

ScratchLease::ScratchLease(ScratchLease&& other) noexcept
    : m_buffer(std::move(other.m_buffer))
    , m_pool(other.m_pool)
    , m_status(other.m_status)
{
    other.m_pool = nullptr;
}

ScratchLease::~ScratchLease()
{
    if (m_pool) {
        m_pool->giveBack(std::move(m_buffer));
    }
}

// =============================================================================
// ScratchPool
// =============================================================================

ScratchPool::ScratchPool()
    : m_initialSize(DEFAULT_INITIAL_SIZE)
    , m_leased(false)
    , m_primed(false)
{
}

ScratchPool::~ScratchPool()
{
}

ScratchPool& ScratchPool::local()
{
    static QThreadStorage<ScratchPool*> pools;
    if (!pools.hasLocalData()) {
        pools.setLocalData(new ScratchPool());
    }
    return *pools.localData();
}

void ScratchPool::setInitialSize(int size)
{
    m_initialSize = qMax(0, size);
}

ScratchLease ScratchPool::acquire(int size, int alignment)
{
    size = qMax(0, size);

    if (m_leased) {
        QSGPT_DEBUG(LogCategory::Buffer,
                    QStringLiteral("Scratch buffer busy, allocating %1 private bytes").arg(size));
        AlignedBuffer fresh(size, alignment);
        return ScratchLease(std::move(fresh), nullptr);
    }

    if (!AlignedBuffer::isValidAlignment(alignment)) {
        AlignedBuffer invalid(size, alignment);
        return ScratchLease(std::move(invalid), nullptr);
    }

    if (!m_primed || m_buffer.isNull() || m_buffer.alignment() != alignment) {
        m_buffer = AlignedBuffer(qMax(size, m_initialSize), alignment);
        m_primed = true;
    }

    // Shrinking keeps the capacity, so the next larger lease reuses it
    const PtStatus status = m_buffer.resize(size);
    if (!status.ok()) {
        QSGPT_WARNING(LogCategory::Buffer, status.toString());
    }
    m_buffer.fill(0);

    m_leased = true;
    return ScratchLease(std::move(m_buffer), this, status);
}

void ScratchPool::giveBack(AlignedBuffer&& buffer)
{
    m_buffer = std::move(buffer);
    m_leased = false;
}

} // namespace qsgpt
