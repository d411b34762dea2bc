#include <gtest/gtest.h>
#include "modelmig/core/result.h"
#include "modelmig/core/error.h"
#include <memory>
#include <string>
#include <vector>

namespace modelmig {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("Invalid input", Error::Code::NOT_VALID);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Invalid input");
    EXPECT_EQ(result.code(), Error::Code::NOT_VALID);
}

TEST(ResultTest, FromTypedError) {
    Result<std::string> result = NotFoundError("migration not found");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.is(Error::Code::NOT_FOUND));
    EXPECT_FALSE(result.is(Error::Code::CONFLICT));
    EXPECT_EQ(result.err().what(), std::string("migration not found"));
}

TEST(ResultTest, VectorResult) {
    std::vector<std::string> tags = {"machine-0", "unit-mysql-0"};
    Result<std::vector<std::string>> result(tags);
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1], "unit-mysql-0");
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));

    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.ok());
    std::unique_ptr<int> owned = result.take_value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, VoidResult) {
    Result<void> result;
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, VoidErrorResult) {
    Result<void> result = RaceError("phase already changed");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.is(Error::Code::RACE));
    EXPECT_EQ(result.error(), "phase already changed");

    Result<void> copy = result;
    EXPECT_TRUE(copy.is(Error::Code::RACE));
}

TEST(ResultTest, ExceptionOnErrorAccess) {
    Result<int> result(42);
    EXPECT_THROW(result.error(), std::runtime_error);
    EXPECT_THROW(result.err(), std::runtime_error);

    Result<void> ok;
    EXPECT_THROW(ok.error(), std::runtime_error);
}

} // namespace
} // namespace core
} // namespace modelmig
