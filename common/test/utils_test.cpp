#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shroud/common/error.h"
#include "shroud/common/file.h"
#include "shroud/common/utils.h"

namespace shroud::test {

enum class TestError {
    AE_FIRST,
    AE_SECOND,
};

} // namespace shroud::test

template <>
struct shroud::ErrorCodeToString<shroud::test::TestError> {
    std::string operator()(shroud::test::TestError e) {
        switch (e) {
        case decltype(e)::AE_FIRST: return "First";
        case decltype(e)::AE_SECOND: return "Second";
        }
        return "Unknown";
    }
};

namespace shroud::test {

TEST(Utils, SplitByAnyOf) {
    ASSERT_TRUE(utils::split_by_any_of("", " \t").empty());

    auto ws = utils::split_by_any_of("0.0.0.0\tads.example  tracker.example", " \t");
    ASSERT_EQ(ws, (std::vector<std::string_view>{"0.0.0.0", "ads.example", "tracker.example"}));
}

TEST(Utils, Trim) {
    std::string_view s = " \t abc \r\n";
    utils::trim(s);
    ASSERT_EQ(s, "abc");
    ASSERT_EQ(utils::trim(std::string_view{"   "}), "");
}

TEST(Utils, CaseConversion) {
    ASSERT_EQ(utils::to_lower("ExAmPle.COM"), "example.com");
    ASSERT_EQ(utils::to_upper("aaaa"), "AAAA");
}

TEST(Utils, IpValidation) {
    ASSERT_TRUE(utils::is_valid_ip4("0.0.0.0"));
    ASSERT_TRUE(utils::is_valid_ip4("127.0.0.1"));
    ASSERT_FALSE(utils::is_valid_ip4("256.0.0.1"));
    ASSERT_FALSE(utils::is_valid_ip4("example.com"));
    ASSERT_TRUE(utils::is_valid_ip6("::1"));
    ASSERT_TRUE(utils::is_valid_ip6("2606:4700:4700::1111"));
    ASSERT_FALSE(utils::is_valid_ip6("1.1.1.1"));
}

TEST(Utils, ForEachLine) {
    std::vector<std::string> lines;
    size_t n = file::for_each_line("first\r\n  second \n\nthird", [&](size_t, std::string_view line) {
        lines.emplace_back(line);
        return true;
    });
    ASSERT_EQ(n, 4u);
    ASSERT_EQ(lines, (std::vector<std::string>{"first", "second", "", "third"}));

    size_t visited = file::for_each_line("a\nb\nc", [](size_t, std::string_view line) {
        return line != "b";
    });
    ASSERT_EQ(visited, 2u);
}

TEST(Error, Chain) {
    auto inner = make_error(TestError::AE_SECOND, "inner details");
    auto outer = make_error(TestError::AE_FIRST, inner);
    ASSERT_EQ(outer->value(), TestError::AE_FIRST);
    ASSERT_EQ(outer->str(), "First\nCaused by: Second: inner details");
}

TEST(Error, Result) {
    Result<int, TestError> ok = 42;
    ASSERT_FALSE(ok.has_error());
    ASSERT_EQ(ok.value(), 42);

    Result<int, TestError> failed = make_error(TestError::AE_SECOND);
    ASSERT_TRUE(failed.has_error());
    ASSERT_EQ(failed.error()->value(), TestError::AE_SECOND);
}

} // namespace shroud::test
