/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * ScratchPool Tests
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "buffer/ScratchPool.h"

#include <gtest/gtest.h>

#include <QThread>

#include <limits>
#include <utility>

using namespace qsgpt;

TEST(ScratchPool, LeaseIsZeroedAndSized)
{
    ScratchPool pool;
    {
        ScratchLease lease = pool.acquire(64, 16);
        ASSERT_TRUE(lease.status().ok());
        EXPECT_TRUE(lease.isPooled());
        EXPECT_EQ(lease.size(), 64);
        EXPECT_TRUE(pool.isLeased());
        lease.buffer().fill(0x5A);
    }
    EXPECT_FALSE(pool.isLeased());

    ScratchLease again = pool.acquire(64, 16);
    EXPECT_EQ(again.buffer().toByteArray(), QByteArray(64, '\0'));
}

TEST(ScratchPool, BufferIsReused)
{
    ScratchPool pool;
    const quint8* first = nullptr;
    {
        ScratchLease lease = pool.acquire(100, 64);
        first = lease.data();
    }
    ScratchLease lease = pool.acquire(200, 64);
    EXPECT_EQ(lease.data(), first);
}

TEST(ScratchPool, InitialSizeIsMinimumAllocation)
{
    ScratchPool pool;
    pool.setInitialSize(8192);
    EXPECT_EQ(pool.initialSize(), 8192);
    {
        ScratchLease lease = pool.acquire(10);
        EXPECT_EQ(lease.size(), 10);
    }
    EXPECT_EQ(pool.pooledSize(), 10);
}

TEST(ScratchPool, NestedAcquireGetsPrivateBuffer)
{
    ScratchPool pool;
    ScratchLease outer = pool.acquire(32);
    ScratchLease inner = pool.acquire(48);

    EXPECT_TRUE(outer.isPooled());
    EXPECT_FALSE(inner.isPooled());
    EXPECT_EQ(inner.size(), 48);
    EXPECT_NE(inner.data(), outer.data());
}

TEST(ScratchPool, AlignmentChangeReallocates)
{
    ScratchPool pool;
    {
        ScratchLease lease = pool.acquire(16, 8);
        EXPECT_EQ(lease.buffer().alignment(), 8);
    }
    ScratchLease lease = pool.acquire(16, 4096);
    EXPECT_EQ(lease.buffer().alignment(), 4096);
    EXPECT_EQ(reinterpret_cast<quintptr>(lease.data()) % 4096, 0u);
}

TEST(ScratchPool, InvalidAlignmentIsNotPooled)
{
    ScratchPool pool;
    ScratchLease lease = pool.acquire(16, 6);
    EXPECT_FALSE(lease.isPooled());
    EXPECT_EQ(lease.status().error, PtError::InvalidArgument);
    EXPECT_FALSE(pool.isLeased());
}

TEST(ScratchPool, OversizedLeaseReportsFailure)
{
    ScratchPool pool;
    {
        ScratchLease lease = pool.acquire(64, 4096);
        ASSERT_TRUE(lease.status().ok());
    }

    {
        ScratchLease lease = pool.acquire(std::numeric_limits<int>::max() - 10, 4096);
        EXPECT_EQ(lease.status().error, PtError::ResourceExhausted);
        EXPECT_EQ(lease.size(), 64);
    }
    EXPECT_FALSE(pool.isLeased());

    ScratchLease lease = pool.acquire(128, 4096);
    EXPECT_TRUE(lease.status().ok());
    EXPECT_EQ(lease.size(), 128);
}

TEST(ScratchPool, MovedLeaseReturnsOnce)
{
    ScratchPool pool;
    {
        ScratchLease lease = pool.acquire(8);
        ScratchLease moved(std::move(lease));
        EXPECT_FALSE(lease.isPooled());
        EXPECT_TRUE(moved.isPooled());
        EXPECT_TRUE(pool.isLeased());
    }
    EXPECT_FALSE(pool.isLeased());
    EXPECT_EQ(pool.pooledSize(), 8);
}

TEST(ScratchPool, LocalPoolIsPerThread)
{
    ScratchPool* mainPool = &ScratchPool::local();
    EXPECT_EQ(&ScratchPool::local(), mainPool);

    ScratchPool* workerPool = nullptr;
    QThread* worker = QThread::create([&workerPool]() {
        workerPool = &ScratchPool::local();
    });
    worker->start();
    worker->wait();
    delete worker;

    EXPECT_NE(workerPool, nullptr);
    EXPECT_NE(workerPool, mainPool);
}
