#include <gtest/gtest.h>

#include "Cosmos/World/World.hpp"

using namespace Cosmos;

class SystemRegistryTest : public ::testing::Test
{
protected:
    World world{"alpha"};

    const Query movement = Mask::FromBit(1) | Mask::FromBit(2);
    const Query render = Mask::FromBit(3);
    const Address h1{"CHANDLER1"};
    const Address h2{"CHANDLER2"};
};

TEST_F(SystemRegistryTest, AddBindsHandler)
{
    EXPECT_FALSE(world.AddSystem(movement, h1).has_value());

    const Address* bound = world.FindSystem(movement);
    ASSERT_NE(bound, nullptr);
    EXPECT_EQ(*bound, h1);
    EXPECT_EQ(world.SystemCount(), 1u);
}

TEST_F(SystemRegistryTest, SameQueryOverwrites)
{
    world.AddSystem(movement, h1);

    const auto replaced = world.AddSystem(movement, h2);
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(*replaced, h1);
    EXPECT_EQ(*world.FindSystem(movement), h2);
    EXPECT_EQ(world.SystemCount(), 1u);
}

TEST_F(SystemRegistryTest, OneHandlerMayServeManyQueries)
{
    world.AddSystem(movement, h1);
    world.AddSystem(render, h1);

    EXPECT_EQ(world.SystemCount(), 2u);
    EXPECT_EQ(*world.FindSystem(render), h1);
}

TEST_F(SystemRegistryTest, QueriesMatchExactlyNotBySubset)
{
    world.AddSystem(movement, h1);

    EXPECT_EQ(world.FindSystem(Mask::FromBit(1)), nullptr);
    EXPECT_EQ(world.FindSystem(movement | render), nullptr);
}

TEST_F(SystemRegistryTest, RemoveSystem)
{
    world.AddSystem(movement, h1);

    EXPECT_TRUE(world.RemoveSystem(movement));
    EXPECT_EQ(world.FindSystem(movement), nullptr);
    EXPECT_FALSE(world.RemoveSystem(movement));
    EXPECT_EQ(world.SystemCount(), 0u);
}

TEST_F(SystemRegistryTest, SystemsDoNotTouchEntities)
{
    world.AddSystem(movement, h1);
    world.RemoveSystem(render);

    EXPECT_EQ(world.Counter(), 0u);
    EXPECT_EQ(world.EntityCount(), 0u);
}
