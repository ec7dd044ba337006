#include <gtest/gtest.h>

#include "Cosmos/Storage/MemoryStore.hpp"
#include "Cosmos/Storage/Transaction.hpp"
#include "../TestHelpers.hpp"

using namespace Cosmos;

namespace
{
    Bytes Blob(unsigned char value)
    {
        return Bytes{static_cast<std::byte>(value)};
    }
}

class TransactionTest : public ::testing::Test
{
protected:
    MemoryStore store;
};

TEST_F(TransactionTest, StagedWritesAreInvisibleUntilCommit)
{
    Transaction tx(store);
    ASSERT_TRUE(tx.Set("world", Blob(1)).IsOk());

    EXPECT_TRUE(tx.IsDirty());
    EXPECT_EQ(tx.StagedCount(), 1u);
    EXPECT_FALSE(store.Get("world").Value().has_value());
    EXPECT_EQ(store.WriteCount(), 0u);
}

TEST_F(TransactionTest, ReadsSeeStagedValuesFirst)
{
    ASSERT_TRUE(store.Set("world", Blob(1)).IsOk());

    Transaction tx(store);
    EXPECT_EQ(*tx.Get("world").Value(), Blob(1));

    ASSERT_TRUE(tx.Set("world", Blob(2)).IsOk());
    EXPECT_EQ(*tx.Get("world").Value(), Blob(2));
    EXPECT_TRUE(tx.Has("world").Value());
    EXPECT_FALSE(tx.Has("register").Value());
}

TEST_F(TransactionTest, CommitAppliesInStagingOrder)
{
    Transaction tx(store);
    ASSERT_TRUE(tx.Set("world", Blob(1)).IsOk());
    ASSERT_TRUE(tx.Set("genesis", Blob(2)).IsOk());
    ASSERT_TRUE(tx.Set("world", Blob(3)).IsOk());
    EXPECT_EQ(tx.StagedCount(), 2u);

    ASSERT_TRUE(tx.Commit().IsOk());

    EXPECT_EQ(store.WriteCount(), 2u);
    EXPECT_EQ(*store.Get("world").Value(), Blob(3));
    EXPECT_EQ(*store.Get("genesis").Value(), Blob(2));
    EXPECT_FALSE(tx.IsDirty());
}

TEST_F(TransactionTest, DroppedTransactionWritesNothing)
{
    {
        Transaction tx(store);
        ASSERT_TRUE(tx.Set("world", Blob(1)).IsOk());
    }
    EXPECT_EQ(store.WriteCount(), 0u);
    EXPECT_EQ(store.Size(), 0u);
}

TEST_F(TransactionTest, RollbackDiscardsStagedWrites)
{
    Transaction tx(store);
    ASSERT_TRUE(tx.Set("world", Blob(1)).IsOk());
    tx.Rollback();

    EXPECT_FALSE(tx.IsDirty());
    ASSERT_TRUE(tx.Commit().IsOk());
    EXPECT_EQ(store.WriteCount(), 0u);
}

TEST_F(TransactionTest, CommitIsSingleUse)
{
    Transaction tx(store);
    ASSERT_TRUE(tx.Set("world", Blob(1)).IsOk());
    ASSERT_TRUE(tx.Commit().IsOk());

    auto again = tx.Commit();
    ASSERT_TRUE(again.IsErr());
    EXPECT_EQ(again.Error().code, ErrorCode::InvalidArgument);

    auto late = tx.Set("world", Blob(2));
    ASSERT_TRUE(late.IsErr());
    EXPECT_EQ(*store.Get("world").Value(), Blob(1));
}

TEST_F(TransactionTest, StagedEraseHidesStoredValue)
{
    ASSERT_TRUE(store.Set("register", Blob(1)).IsOk());

    Transaction tx(store);
    ASSERT_TRUE(tx.Erase("register").IsOk());
    EXPECT_FALSE(tx.Has("register").Value());
    EXPECT_FALSE(tx.Get("register").Value().has_value());
    EXPECT_TRUE(store.Has("register").Value());

    ASSERT_TRUE(tx.Commit().IsOk());
    EXPECT_FALSE(store.Has("register").Value());
    EXPECT_EQ(store.Size(), 0u);
}

TEST_F(TransactionTest, FailedCommitRestoresAppliedKeys)
{
    Cosmos::Test::LogCapture capture(LogLevel::Error);
    Cosmos::Test::FaultyStore faulty;
    ASSERT_TRUE(faulty.Set("register", Blob(7)).IsOk());
    faulty.FailWritesTo("genesis");

    Transaction tx(faulty);
    ASSERT_TRUE(tx.Set("register", Blob(1)).IsOk());
    ASSERT_TRUE(tx.Set("world", Blob(2)).IsOk());
    ASSERT_TRUE(tx.Set("genesis", Blob(3)).IsOk());

    auto committed = tx.Commit();
    ASSERT_TRUE(committed.IsErr());
    EXPECT_EQ(committed.Error().code, ErrorCode::StorageError);

    // register held a value before the commit and gets it back; world was absent and is erased again
    EXPECT_EQ(*faulty.Inner().Get("register").Value(), Blob(7));
    EXPECT_FALSE(faulty.Inner().Get("world").Value().has_value());
    EXPECT_FALSE(faulty.Inner().Get("genesis").Value().has_value());
    EXPECT_TRUE(capture.Contains("commit failed at key 'genesis'"));

    // The transaction is still pending and can be retried once the store recovers
    EXPECT_TRUE(tx.IsDirty());
    faulty.Heal();
    ASSERT_TRUE(tx.Commit().IsOk());
    EXPECT_EQ(*faulty.Inner().Get("register").Value(), Blob(1));
    EXPECT_EQ(*faulty.Inner().Get("world").Value(), Blob(2));
    EXPECT_EQ(*faulty.Inner().Get("genesis").Value(), Blob(3));
}
