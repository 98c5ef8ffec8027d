#pragma once
#include <string>
#include "SensorFrame.hpp"

// Deterministic fallback classifier working on pressure geometry only.
class RuleClassifier {
public:
    struct Decision { int label; double confidence; };

    Decision classify(const FeatureVector& pressure) const;
    // Name of the branch classify() takes for the same input.
    std::string reason(const FeatureVector& pressure) const;

private:
    enum class Branch { NoPressure, LeftHeavy, RightHeavy, FrontHeavy, Balanced };
    struct Geometry { double total, left, right, front, back, mean, headPeak; };

    static Geometry measure(const FeatureVector& pressure);
    static Branch branchOf(const Geometry& g);
};
