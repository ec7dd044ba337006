#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "Cosmos/Core/Result.hpp"

using namespace Cosmos;

class ResultTest : public ::testing::Test
{
protected:
    static Result<int, Error> Halve(int value)
    {
        if (value % 2 != 0)
        {
            return Err(MakeError(ErrorCode::InvalidArgument, "odd input"));
        }
        return value / 2;
    }
};

TEST_F(ResultTest, HoldsValue)
{
    auto result = Halve(8);

    ASSERT_TRUE(result.IsOk());
    EXPECT_FALSE(result.IsErr());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.Value(), 4);
    EXPECT_EQ(*result, 4);
    EXPECT_EQ(result.ValueOr(-1), 4);
}

TEST_F(ResultTest, HoldsError)
{
    auto result = Halve(3);

    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error().code, ErrorCode::InvalidArgument);
    EXPECT_STREQ(result.Error().message, "odd input");
    EXPECT_EQ(result.ValueOr(-1), -1);
    EXPECT_TRUE(result == Err(MakeError(ErrorCode::InvalidArgument)));
}

TEST_F(ResultTest, CopyAndMovePreserveState)
{
    Result<std::vector<std::string>, Error> original(std::vector<std::string>{"a", "b"});

    Result<std::vector<std::string>, Error> copy = original;
    ASSERT_TRUE(copy.IsOk());
    EXPECT_EQ(copy.Value().size(), 2u);

    Result<std::vector<std::string>, Error> moved = std::move(copy);
    ASSERT_TRUE(moved.IsOk());
    EXPECT_EQ(moved.Value()[1], "b");

    Result<std::vector<std::string>, Error> failed = Err(MakeError(ErrorCode::StorageError));
    moved = failed;
    EXPECT_TRUE(moved.IsErr());
    EXPECT_EQ(moved.Error().code, ErrorCode::StorageError);
}

TEST_F(ResultTest, VoidResultDefaultsToSuccess)
{
    Result<void, Error> ok;
    EXPECT_TRUE(ok.IsOk());
    EXPECT_TRUE(Ok().IsOk());

    Result<void, Error> failed = Err(MakeError(ErrorCode::WorldNotCreated));
    ASSERT_TRUE(failed.IsErr());
    EXPECT_TRUE(failed.Error().IsPrecondition());
}

TEST_F(ResultTest, ErrorsCompareByCode)
{
    EXPECT_EQ(MakeError(ErrorCode::CorruptedRecord, "a"), MakeError(ErrorCode::CorruptedRecord, "b"));
    EXPECT_NE(MakeError(ErrorCode::CorruptedRecord), MakeError(ErrorCode::StorageError));
    EXPECT_FALSE(MakeError(ErrorCode::CapacityExceeded).IsPrecondition());
    EXPECT_TRUE(MakeError(ErrorCode::RegistryMissing).IsPrecondition());
}

TEST_F(ResultTest, ErrorFormatting)
{
    EXPECT_EQ(ToString(ErrorCode::CapacityExceeded), "CapacityExceeded");
    EXPECT_EQ(fmt::format("{}", MakeError(ErrorCode::InvalidArgument, "bad key")), "InvalidArgument (bad key)");
    EXPECT_STREQ(MakeError(ErrorCode::WorldNotCreated).message, "World has not been created by genesis");
}
