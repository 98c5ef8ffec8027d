#include <gtest/gtest.h>
#include "PosturePolicy.hpp"
#include "TestUtil.hpp"

TEST(PosturePolicy, DefaultsWhenFileIsMissing){
    PosturePolicy p;
    EXPECT_FALSE(p.load(tempPath("missing.cfg")));
    EXPECT_EQ(p.classCount, 8);
    EXPECT_TRUE(p.isAmbiguous(0));
    EXPECT_TRUE(p.isAmbiguous(4));
    EXPECT_FALSE(p.isAmbiguous(7));
    EXPECT_DOUBLE_EQ(p.severityOf(4), 4.0);
    EXPECT_DOUBLE_EQ(p.severityOf(42), 1.0);
}

TEST(PosturePolicy, OverridesFromFile){
    const std::string path = writeTempFile("policy.cfg",
        "# tuned\n"
        "stage2_override_confidence 0.75\n"
        "stage2_ambiguous_3 1   # slouched\n"
        "stage2_ambiguous_0 0\n"
        "severity_5 2.5\n"
        "penalty_cap 30\n"
        "not_a_key 12\n"
        "broken\n");
    PosturePolicy p;
    ASSERT_TRUE(p.load(path));
    EXPECT_DOUBLE_EQ(p.stage2OverrideConfidence, 0.75);
    EXPECT_TRUE(p.isAmbiguous(3));
    EXPECT_FALSE(p.isAmbiguous(0));
    EXPECT_FALSE(p.isAmbiguous(4));
    EXPECT_DOUBLE_EQ(p.severityOf(5), 2.5);
    EXPECT_DOUBLE_EQ(p.penaltyCap, 30.0);
    EXPECT_DOUBLE_EQ(p.penaltyFactor, 0.15);
}

TEST(PosturePolicy, GrowsSeverityTableWithClassCount){
    PosturePolicy p;
    ASSERT_TRUE(p.load(writeTempFile("policy.cfg", "class_count 10\nseverity_9 5\n")));
    EXPECT_EQ(p.classCount, 10);
    EXPECT_DOUBLE_EQ(p.severityOf(8), 1.0);
    EXPECT_DOUBLE_EQ(p.severityOf(9), 5.0);
}

TEST(PosturePolicy, IgnoresOutOfRangeSizes){
    PosturePolicy p;
    ASSERT_TRUE(p.load(writeTempFile("policy.cfg",
        "class_count 1e12\n"
        "pressure_length 1e15\n"
        "inertial_length 5000\n"
        "severity_100000000 3\n"
        "stage2_ambiguous_4000000000 1\n"
        "severity_255 2\n")));
    EXPECT_EQ(p.classCount, 8);
    EXPECT_EQ(p.pressureLength, 11u);
    EXPECT_EQ(p.inertialLength, 6u);
    EXPECT_DOUBLE_EQ(p.severityOf(100000000), 1.0);
    EXPECT_DOUBLE_EQ(p.severityOf(255), 2.0);
    EXPECT_TRUE(p.isAmbiguous(4));
}
