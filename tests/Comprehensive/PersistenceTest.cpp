#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <vector>

#include "Cosmos/Ledger/WorldLedger.hpp"
#include "Cosmos/Storage/FileStore.hpp"
#include "../TestHelpers.hpp"

using namespace Cosmos;
using Cosmos::Test::LogCapture;
using Cosmos::Test::ScopedTempDir;

class PersistenceTest : public ::testing::Test
{
protected:
    FileStore OpenStore()
    {
        FileStore store(dir.Path());
        EXPECT_TRUE(store.Open().IsOk());
        return store;
    }

    ScopedTempDir dir;
    LogCapture capture{LogLevel::Error};

    const Address x{"CXXX"};
    const Address y{"CYYY"};
};

TEST_F(PersistenceTest, StateSurvivesNewLedgerInstances)
{
    {
        FileStore store = OpenStore();
        WorldLedger ledger(store);
        ASSERT_TRUE(ledger.Genesis("alpha").IsOk());
        const std::vector<Address> both{x, y};
        ASSERT_TRUE(ledger.Spawn(both).IsOk());
        ASSERT_TRUE(ledger.AddSystem(Mask(6), Address("CHANDLER")).IsOk());
    }

    {
        FileStore store = OpenStore();
        WorldLedger ledger(store);
        ASSERT_TRUE(ledger.Despawn(x).IsOk());
    }

    FileStore store = OpenStore();
    WorldLedger ledger(store);
    EXPECT_TRUE(ledger.IsGenesis().Value());

    auto world = ledger.GetWorld();
    ASSERT_TRUE(world.IsOk());
    EXPECT_EQ(world.Value().Name(), "alpha");
    EXPECT_EQ(world.Value().Counter(), 1u);
    EXPECT_EQ(world.Value().FindEntity(1)->mask, Mask(6));
    EXPECT_EQ(*world.Value().FindSystem(Mask(6)), Address("CHANDLER"));

    auto reg = ledger.GetRegister();
    ASSERT_TRUE(reg.IsOk());
    EXPECT_FALSE(reg.Value().Contains(x));
    EXPECT_TRUE(reg.Value().Contains(y));
    EXPECT_EQ(reg.Value().NextBit(), 2u);
}

TEST_F(PersistenceTest, RecordsLiveUnderFixedKeys)
{
    FileStore store = OpenStore();
    WorldLedger ledger(store);
    ASSERT_TRUE(ledger.Genesis("alpha").IsOk());
    const std::vector<Address> components{x};
    ASSERT_TRUE(ledger.Spawn(components).IsOk());

    EXPECT_TRUE(std::filesystem::exists(dir.Path() / "genesis.rec"));
    EXPECT_TRUE(std::filesystem::exists(dir.Path() / "world.rec"));
    EXPECT_TRUE(std::filesystem::exists(dir.Path() / "register.rec"));
}

TEST_F(PersistenceTest, TruncatedFileIsCorruption)
{
    {
        FileStore store = OpenStore();
        WorldLedger ledger(store);
        ASSERT_TRUE(ledger.Genesis("alpha").IsOk());
    }

    const auto path = dir.Path() / "world.rec";
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 1);

    FileStore store = OpenStore();
    WorldLedger ledger(store);
    auto world = ledger.GetWorld();
    ASSERT_TRUE(world.IsErr());
    EXPECT_EQ(world.Error().code, ErrorCode::CorruptedRecord);
    EXPECT_TRUE(capture.Contains("world"));
}

TEST_F(PersistenceTest, ChecksumVerificationCanBeDisabled)
{
    {
        FileStore store = OpenStore();
        WorldLedger ledger(store);
        ASSERT_TRUE(ledger.Genesis("alpha").IsOk());
    }

    // Corrupt only the stored checksum (header bytes 13..16)
    const auto path = dir.Path() / "world.rec";
    {
        std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
        ASSERT_TRUE(file.is_open());
        file.seekp(13);
        const char garbage[4] = {'\x11', '\x22', '\x33', '\x44'};
        file.write(garbage, sizeof(garbage));
    }

    FileStore store = OpenStore();
    EXPECT_TRUE(WorldLedger(store).GetWorld().IsErr());

    WorldLedger relaxed(store, WorldLedger::Config{LogLevel::Debug, false});
    auto world = relaxed.GetWorld();
    ASSERT_TRUE(world.IsOk());
    EXPECT_EQ(world.Value().Name(), "alpha");
}
