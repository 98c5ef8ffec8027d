#pragma once
#include <string>

// Class ids produced by the seat classifier.
constexpr int kPostureUpright = 0;
constexpr int kPostureRightLegCrossed = 1;
constexpr int kPostureLeftLegCrossed = 2;
constexpr int kPostureSlouched = 3;
constexpr int kPostureTurtleNeck = 4;
constexpr int kPostureRightArmrest = 5;
constexpr int kPostureLeftArmrest = 6;
constexpr int kPostureHeadForward = 7;
constexpr int kPostureClassCount = 8;

std::string postureName(int label);
