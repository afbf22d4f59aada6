#include "common/exceptions.hpp"
#include "evaluator/filters.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(FilterTest, WhitespaceTest) {
    auto filter = get_filter("whitespace");
    EXPECT_EQ(filter->apply("1  2\t\t3\n"), "1 2 3\n");
    EXPECT_EQ(filter->apply("a \t\nb  \n"), "a\nb\n");
    EXPECT_EQ(filter->apply("end   "), "end");
}

TEST(FilterTest, TrimTest) {
    auto filter = get_filter("trim");
    EXPECT_EQ(filter->apply("a  \nb\t\n\n\n"), "a\nb\n");
    EXPECT_EQ(filter->apply("a"), "a\n");
    EXPECT_EQ(filter->apply("\n\n"), "");
    EXPECT_EQ(filter->apply("  indented\n"), "  indented\n");
}

TEST(FilterTest, LowercaseTest) {
    EXPECT_EQ(get_filter("lowercase")->apply("Hello WORLD\n"), "hello world\n");
}

TEST(FilterTest, CrlfTest) {
    EXPECT_EQ(get_filter("crlf")->apply("a\r\nb\r\n"), "a\nb\n");
    EXPECT_EQ(get_filter("crlf")->apply("a\rb"), "a\rb");
}

TEST(FilterTest, IdempotentTest) {
    const string sample = "  Hello \t World  \r\n\r\nsecond\tline \n\n\n";
    for (const string name : {"whitespace", "trim", "lowercase", "crlf"}) {
        auto filter = get_filter(name);
        string once = filter->apply(sample);
        EXPECT_EQ(filter->apply(once), once) << name;
    }
}

TEST(FilterTest, ChainTest) {
    vector<filter_ptr> filters = {get_filter("crlf"), get_filter("whitespace"), get_filter("lowercase")};
    EXPECT_EQ(apply_filters("A  B \r\nC\r\n", filters), "a b\nc\n");
    EXPECT_EQ(apply_filters("unchanged", {}), "unchanged");
}

TEST(FilterTest, LookupTest) {
    EXPECT_EQ(get_filter("WhiteSpace")->name(), "whitespace");
    EXPECT_THROW(get_filter("nonexistent"), configuration_error);
}

struct reverse_filter : public filter {
    string name() const override {
        return "Reverse";
    }

    string apply(const string &text) const override {
        return string(text.rbegin(), text.rend());
    }
};

TEST(FilterTest, RegisterTest) {
    register_filter(make_unique<reverse_filter>());
    EXPECT_EQ(get_filter("reverse")->apply("abc"), "cba");
}
