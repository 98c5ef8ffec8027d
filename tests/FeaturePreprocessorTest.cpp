#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "FeaturePreprocessor.hpp"

TEST(FeaturePreprocessor, PadsShortVectorsWithTrailingZeros){
    const FeatureVector out = normalizeFeatures({1.0, 2.0, 3.0}, 11);
    ASSERT_EQ(out.size(), 11u);
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 2.0);
    EXPECT_DOUBLE_EQ(out[2], 3.0);
    for(std::size_t i = 3; i < out.size(); ++i) EXPECT_DOUBLE_EQ(out[i], 0.0);
}

TEST(FeaturePreprocessor, TruncatesLongVectorsWithoutReordering){
    std::vector<double> raw;
    for(int i = 0; i < 9; ++i) raw.push_back(i * 10.0);
    const FeatureVector out = normalizeFeatures(raw, 6);
    ASSERT_EQ(out.size(), 6u);
    for(std::size_t i = 0; i < out.size(); ++i) EXPECT_DOUBLE_EQ(out[i], raw[i]);
}

TEST(FeaturePreprocessor, ExactLengthIsUnchanged){
    const std::vector<double> raw{5, 4, 3, 2, 1, 0};
    EXPECT_EQ(normalizeFeatures(raw, 6), raw);
}

TEST(FeaturePreprocessor, RejectsEmptyPressure){
    std::vector<std::string> warnings;
    std::string error;
    EXPECT_FALSE(validatePressure({}, warnings, error));
    EXPECT_FALSE(error.empty());
}

TEST(FeaturePreprocessor, RejectsNonFiniteReadings){
    std::vector<std::string> warnings;
    std::string error;
    EXPECT_FALSE(validatePressure({1.0, std::numeric_limits<double>::quiet_NaN()}, warnings, error));
    EXPECT_NE(error.find("pressure[1]"), std::string::npos);
    EXPECT_FALSE(validatePressure({std::numeric_limits<double>::infinity()}, warnings, error));
}

TEST(FeaturePreprocessor, NegativeReadingsOnlyWarn){
    std::vector<std::string> warnings;
    std::string error;
    EXPECT_TRUE(validatePressure({10.0, -3.0, 5.0, -1.0}, warnings, error));
    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_TRUE(error.empty());
}
