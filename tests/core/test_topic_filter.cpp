#include <gtest/gtest.h>
#include "mqttd/core/errors.h"
#include "mqttd/core/topic_filter.h"

using namespace mqttd::core;
using namespace mqttd::core::topic;

TEST(TopicFilterTest, LiteralFilterMatchesOnlyItself) {
    EXPECT_TRUE(filterMatches("a/b/c", "a/b/c"));
    EXPECT_FALSE(filterMatches("a/b/c", "a/b"));
    EXPECT_FALSE(filterMatches("a/b/c", "a/b/c/d"));
    EXPECT_FALSE(filterMatches("a/b/c", "a/x/c"));
}

TEST(TopicFilterTest, PlusMatchesExactlyOneSegment) {
    EXPECT_TRUE(filterMatches("sensor/+/temp", "sensor/kitchen/temp"));
    EXPECT_TRUE(filterMatches("sensor/+/temp", "sensor//temp"));
    EXPECT_FALSE(filterMatches("sensor/+/temp", "sensor/temp"));
    EXPECT_FALSE(filterMatches("sensor/+/temp", "sensor/a/b/temp"));
    EXPECT_TRUE(filterMatches("+", "anything"));
    EXPECT_FALSE(filterMatches("+", "a/b"));
}

TEST(TopicFilterTest, HashMatchesRemainingSegments) {
    EXPECT_TRUE(filterMatches("#", "a"));
    EXPECT_TRUE(filterMatches("#", "a/b/c"));
    EXPECT_TRUE(filterMatches("down/#", "down/x"));
    EXPECT_TRUE(filterMatches("down/#", "down/x/y/z"));
    EXPECT_FALSE(filterMatches("down/#", "up/x"));
    EXPECT_TRUE(filterMatches("down/+/user01/#", "down/site/user01/cmd"));
    EXPECT_FALSE(filterMatches("down/+/user01/#", "down/site/user02/cmd"));
}

TEST(TopicFilterTest, EmptySegmentsAreSignificant) {
    EXPECT_TRUE(filterMatches("/a", "/a"));
    EXPECT_FALSE(filterMatches("a", "/a"));
    EXPECT_TRUE(filterMatches("a/", "a/"));
    EXPECT_FALSE(filterMatches("a", "a/"));
}

TEST(TopicFilterTest, SplitKeepsEmptySegments) {
    auto segments = splitSegments("/a//b/");
    ASSERT_EQ(segments.size(), 5u);
    EXPECT_EQ(segments[0], "");
    EXPECT_EQ(segments[1], "a");
    EXPECT_EQ(segments[2], "");
    EXPECT_EQ(segments[3], "b");
    EXPECT_EQ(segments[4], "");
}

TEST(TopicFilterTest, ValidationRejectsMisplacedWildcards) {
    EXPECT_NO_THROW(validateFilter("a/+/b/#"));
    EXPECT_NO_THROW(validateFilter("#"));
    EXPECT_NO_THROW(validateFilter("+/+"));

    EXPECT_THROW(validateFilter(""), ConfigError);
    EXPECT_THROW(validateFilter("a/#/b"), ConfigError);
    EXPECT_THROW(validateFilter("a/b#"), ConfigError);
    EXPECT_THROW(validateFilter("a/b+/c"), ConfigError);

    EXPECT_TRUE(isValidFilter("a/#"));
    EXPECT_FALSE(isValidFilter("#/a"));
}

TEST(TopicFilterTest, CoverageBetweenFilters) {
    EXPECT_TRUE(filterCovers("#", "a/b"));
    EXPECT_TRUE(filterCovers("a/#", "a/b/#"));
    EXPECT_TRUE(filterCovers("a/+", "a/b"));
    EXPECT_TRUE(filterCovers("a/+", "a/+"));
    EXPECT_TRUE(filterCovers("a/b", "a/b"));

    EXPECT_FALSE(filterCovers("a/b", "a/+"));
    EXPECT_FALSE(filterCovers("a/+", "a/#"));
    EXPECT_FALSE(filterCovers("a/b", "a/b/c"));
    EXPECT_FALSE(filterCovers("a/b/#", "a/#"));
}
