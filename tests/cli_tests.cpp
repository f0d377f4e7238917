#include <gtest/gtest.h>
#include "CommandArgs.h"
#include <sstream>

namespace {

RunArgs parse(const std::string& line) {
    std::istringstream in(line);
    return parseRunArgs(in);
}

}

TEST(RunArgsTest, SweepsOnly) {
    const RunArgs args = parse("250");
    EXPECT_EQ(args.sweeps, 250u);
    EXPECT_EQ(args.logFreq, 0u);
    EXPECT_FALSE(args.ordering.has_value());
}

TEST(RunArgsTest, LogIntervalThenMode) {
    const RunArgs args = parse("100 10 sync");
    EXPECT_EQ(args.sweeps, 100u);
    EXPECT_EQ(args.logFreq, 10u);
    ASSERT_TRUE(args.ordering.has_value());
    EXPECT_EQ(*args.ordering, UpdateOrdering::Synchronous);
}

// The mode may follow the sweep count directly
TEST(RunArgsTest, ModeWithoutLogInterval) {
    const RunArgs args = parse("100 sync");
    EXPECT_EQ(args.sweeps, 100u);
    EXPECT_EQ(args.logFreq, 0u);
    ASSERT_TRUE(args.ordering.has_value());
    EXPECT_EQ(*args.ordering, UpdateOrdering::Synchronous);

    const RunArgs swapped = parse("100 async 5");
    EXPECT_EQ(swapped.logFreq, 5u);
    EXPECT_EQ(*swapped.ordering, UpdateOrdering::Asynchronous);
}

TEST(RunArgsTest, RejectsBadInput) {
    EXPECT_THROW(parse(""), ConfigurationError);
    EXPECT_THROW(parse("sync"), ConfigurationError);
    EXPECT_THROW(parse("100 sideways"), ConfigurationError);
    EXPECT_THROW(parse("100 5 6"), ConfigurationError);
    EXPECT_THROW(parse("100 sync async"), ConfigurationError);
}
