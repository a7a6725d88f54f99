/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Aligned Buffer Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "AlignedBuffer.h"
#include "../util/Logger.h"

#include <limits>
#include <string.h>
#include <utility>

namespace qsgpt {

// =============================================================================
// Constructor / Destructor
// =============================================================================

AlignedBuffer::AlignedBuffer()
    : m_alignment(0)
    , m_size(0)
    , m_offset(0)
{
}

AlignedBuffer::AlignedBuffer(int size, int alignment)
    : AlignedBuffer(QByteArray(), size, alignment)
{
}

AlignedBuffer::AlignedBuffer(const QByteArray& init, int size, int alignment)
    : m_alignment(0)
    , m_size(0)
    , m_offset(0)
{
    if (size < 0) {
        size = static_cast<int>(init.size());
    }

    if (!isValidAlignment(alignment)) {
        m_status = PtStatus::failure(PtError::InvalidArgument,
                                     QStringLiteral("Alignment %1 is not a power of two").arg(alignment));
        QSGPT_WARNING(LogCategory::Buffer, m_status.message);
        return;
    }

    m_alignment = alignment;
    const PtStatus status = resize(size);
    if (!status.ok()) {
        m_status = status;
        return;
    }

    const int copyLength = qMin(size, static_cast<int>(init.size()));
    if (copyLength > 0) {
        memcpy(data(), init.constData(), static_cast<size_t>(copyLength));
    }
}

AlignedBuffer::~AlignedBuffer()
{
}

AlignedBuffer::AlignedBuffer(AlignedBuffer&& other) noexcept
    : m_storage(std::move(other.m_storage))
    , m_alignment(other.m_alignment)
    , m_size(other.m_size)
    , m_offset(other.m_offset)
    , m_status(std::move(other.m_status))
{
    other.m_size = 0;
    other.m_offset = 0;
}

AlignedBuffer& AlignedBuffer::operator=(AlignedBuffer&& other) noexcept
{
    if (this != &other) {
        m_storage = std::move(other.m_storage);
        m_alignment = other.m_alignment;
        m_size = other.m_size;
        m_offset = other.m_offset;
        m_status = std::move(other.m_status);
        other.m_size = 0;
        other.m_offset = 0;
    }
    return *this;
}

// =============================================================================
// Resizing
// =============================================================================

int AlignedBuffer::alignedOffset(const char* base, int alignment)
{
    const quintptr address = reinterpret_cast<quintptr>(base);
    const quintptr misalignment = address & static_cast<quintptr>(alignment - 1);
    return misalignment ? static_cast<int>(alignment - misalignment) : 0;
}

PtStatus AlignedBuffer::resize(int newSize)
{
    if (isNull()) {
        return m_status;
    }
    if (newSize < 0) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("Negative buffer size %1").arg(newSize));
    }

    if (isAligned() && newSize > std::numeric_limits<int>::max() - m_alignment) {
        return PtStatus::failure(PtError::ResourceExhausted,
                                 QStringLiteral("Buffer of %1 bytes with alignment %2 is too large")
                                     .arg(newSize).arg(m_alignment));
    }

    const int keep = qMin(m_size, newSize);

    if (!isAligned()) {
        m_storage.resize(newSize);
        m_offset = 0;
    } else {
        const int oldOffset = m_offset;

        // QByteArray::resize keeps the prefix, so the old aligned content
        // now sits at oldOffset from the (possibly new) base
        m_storage.resize(newSize + m_alignment);
        char* base = m_storage.data();
        const int newOffset = alignedOffset(base, m_alignment);

        if (newOffset != oldOffset && keep > 0) {
            memmove(base + newOffset, base + oldOffset, static_cast<size_t>(keep));
            QSGPT_TRACE(LogCategory::Buffer,
                        QStringLiteral("Aligned start moved from %1 to %2, kept %3 bytes")
                            .arg(oldOffset).arg(newOffset).arg(keep));
        }
        m_offset = newOffset;
    }

    if (newSize > keep) {
        memset(m_storage.data() + m_offset + keep, 0, static_cast<size_t>(newSize - keep));
    }
    m_size = newSize;

    return PtStatus::success();
}

// =============================================================================
// Access
// =============================================================================

PtStatus AlignedBuffer::write(int offset, const quint8* src, int length)
{
    if (isNull()) {
        return m_status;
    }
    if (offset < 0 || length < 0 || offset > m_size || length > m_size - offset) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("Write of %1 bytes at %2 exceeds buffer size %3")
                                     .arg(length).arg(offset).arg(m_size));
    }
    if (length > 0) {
        if (!src) {
            return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Null source"));
        }
        memmove(data() + offset, src, static_cast<size_t>(length));
    }
    return PtStatus::success();
}

PtStatus AlignedBuffer::write(int offset, const QByteArray& src)
{
    return write(offset, reinterpret_cast<const quint8*>(src.constData()), static_cast<int>(src.size()));
}

void AlignedBuffer::fill(quint8 value)
{
    if (m_size > 0) {
        memset(data(), value, static_cast<size_t>(m_size));
    }
}

quint8* AlignedBuffer::data()
{
    return reinterpret_cast<quint8*>(m_storage.data()) + m_offset;
}

const quint8* AlignedBuffer::data() const
{
    return reinterpret_cast<const quint8*>(m_storage.constData()) + m_offset;
}

QByteArray AlignedBuffer::toByteArray() const
{
    return QByteArray(reinterpret_cast<const char*>(data()), m_size);
}

bool AlignedBuffer::isValidAlignment(int alignment)
{
    if (alignment == 0) {
        return true;
    }
    return alignment > 0 && (alignment & (alignment - 1)) == 0;
}

} // namespace qsgpt
