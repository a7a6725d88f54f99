/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Aligned Buffer Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_ALIGNEDBUFFER_H
#define QSGPT_ALIGNEDBUFFER_H

#include "../libqsgpt_global.h"
#include "../core/PtTypes.h"

#include <QByteArray>

namespace qsgpt {

/**
 * @brief Growable byte buffer whose start address honours a power-of-two alignment
 *
 * Pass-through transports often need DMA buffers aligned to the page or
 * sector size. The backing QByteArray is over-allocated by @c alignment
 * bytes and the visible region starts at the first suitably aligned offset.
 * A resize re-derives that offset and moves the old content along if the
 * offset changed, so bytes already written survive any reallocation.
 *
 * An alignment of 0 (or 1) means "none": the buffer behaves like a plain
 * resizable byte array.
 *
 * Single owner: copying is disabled, moving keeps the allocation.
 */
class LIBQSGPT_EXPORT AlignedBuffer
{
public:
    /**
     * @brief Empty buffer without alignment
     */
    AlignedBuffer();

    /**
     * @brief Zero-filled buffer of @p size bytes
     *
     * An invalid alignment yields a null buffer whose status() reports
     * InvalidArgument.
     */
    explicit AlignedBuffer(int size, int alignment = 0);

    /**
     * @brief Buffer initialised from @p init
     * @param init Initial content, truncated to @p size if longer
     * @param size Logical length, -1 for init.size()
     * @param alignment Start alignment (0 or a power of two)
     */
    AlignedBuffer(const QByteArray& init, int size, int alignment = 0);

    ~AlignedBuffer();

    AlignedBuffer(const AlignedBuffer&) = delete;
    AlignedBuffer& operator=(const AlignedBuffer&) = delete;

    AlignedBuffer(AlignedBuffer&& other) noexcept;
    AlignedBuffer& operator=(AlignedBuffer&& other) noexcept;

    /**
     * @brief Change the logical length
     *
     * Content up to min(old, new) length is preserved even when the
     * reallocated block moves the aligned start. New bytes are zeroed.
     */
    PtStatus resize(int newSize);

    /**
     * @brief Copy @p length bytes into the buffer at @p offset
     * @return InvalidArgument if the range does not fit the logical length
     */
    PtStatus write(int offset, const quint8* src, int length);
    PtStatus write(int offset, const QByteArray& src);

    /**
     * @brief Set every byte of the logical region to @p value
     */
    void fill(quint8 value);

    quint8* data();
    const quint8* data() const;
    const quint8* constData() const { return data(); }

    int size() const { return m_size; }
    int alignment() const { return m_alignment; }
    bool isEmpty() const { return m_size == 0; }

    /**
     * @brief True if construction failed (bad alignment)
     */
    bool isNull() const { return !m_status.ok(); }

    /**
     * @brief Construction status
     */
    PtStatus status() const { return m_status; }

    /**
     * @brief Deep copy of the logical region
     */
    QByteArray toByteArray() const;

    quint8& operator[](int index) { return data()[index]; }
    quint8 operator[](int index) const { return data()[index]; }

    /**
     * @brief 0 or a power of two
     */
    static bool isValidAlignment(int alignment);

private:
    static int alignedOffset(const char* base, int alignment);
    bool isAligned() const { return m_alignment > 1; }

    QByteArray m_storage;   ///< Backing allocation, size + alignment bytes
    int m_alignment;        ///< Requested alignment (0 = none)
    int m_size;             ///< Logical length
    int m_offset;           ///< Aligned start inside m_storage
    PtStatus m_status;      ///< Construction status
};

} // namespace qsgpt

#endif // QSGPT_ALIGNEDBUFFER_H
