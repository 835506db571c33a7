#include "ingest/core/result.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

struct Conflict {
    std::vector<std::string> names;
};

ingest::Result<int> half(int value) {
    if (value % 2 != 0) {
        return ingest::Err<int>(std::string("odd"));
    }
    return ingest::Ok(value / 2);
}

ingest::Result<std::string, Conflict> pick(const std::vector<std::string>& names) {
    if (names.size() != 1) {
        return ingest::Failure(Conflict{names});
    }
    return ingest::Success(names.front());
}

} // namespace

TEST(Result, OkAndError) {
    auto ok = half(8);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 4);

    auto err = half(3);
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "odd");
}

TEST(Result, StructErrorType) {
    auto one = pick({"2024-10-11"});
    ASSERT_TRUE(one.is_ok());
    EXPECT_EQ(one.value(), "2024-10-11");

    auto many = pick({"a", "b"});
    ASSERT_TRUE(many.is_error());
    EXPECT_EQ(many.error().names.size(), 2u);
}

TEST(Result, VoidResult) {
    ingest::Result<void> ok = ingest::Ok();
    EXPECT_TRUE(ok.is_ok());

    auto err = ingest::Err<void>(std::string("broken"));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "broken");
}
