#include <gtest/gtest.h>

#include "utils/StringUtils.hpp"

namespace
{
TEST(string_utils_test, split_keeps_empty_fields)
{
    auto parts = PreflightUtils::split("/usr/bin::/bin", ':');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "/usr/bin");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "/bin");
}

TEST(string_utils_test, join_is_inverse_of_split)
{
    const std::string path = "/a/bin:/usr/bin:/bin";
    EXPECT_EQ(PreflightUtils::join(PreflightUtils::split(path, ':'), ':'), path);
}

TEST(string_utils_test, shell_quote_escapes_single_quotes)
{
    EXPECT_EQ(PreflightUtils::shellQuote("/tmp/plain"), "'/tmp/plain'");
    EXPECT_EQ(PreflightUtils::shellQuote("it's"), "'it'\\''s'");
}
} // namespace
