#include "RuleClassifier.hpp"
#include "FeaturePreprocessor.hpp"
#include "PostureLabels.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr std::size_t kPressureSensors = 11;
constexpr std::size_t kLeftSensors = 5;
constexpr double kSideRatio = 1.5;
constexpr double kFrontRatio = 1.3;
constexpr double kHeadPeakRatio = 1.5;

double clampConfidence(double c){ return std::max(0.3, std::min(0.95, c)); }

double dominance(double dominant, double weaker){
    if(weaker <= 0.0) return 0.95;
    return clampConfidence(0.6 + 0.5 * (dominant / weaker - 1.0));
}

}  // namespace

RuleClassifier::Geometry RuleClassifier::measure(const FeatureVector& pressure){
    const FeatureVector x = normalizeFeatures(pressure, kPressureSensors);
    Geometry g{0, 0, 0, 0, 0, 0, 0};
    for(std::size_t i = 0; i < x.size(); ++i){
        g.total += x[i];
        if(i < kLeftSensors) g.left += x[i]; else g.right += x[i];
    }
    g.front = x[0] + x[1] + x[5] + x[6];
    g.back = x[3] + x[4] + x[8] + x[9];
    g.mean = g.total / static_cast<double>(x.size());
    g.headPeak = std::max({x[0], x[1], x[2]});
    return g;
}

RuleClassifier::Branch RuleClassifier::branchOf(const Geometry& g){
    if(g.total <= 0.0) return Branch::NoPressure;
    if(g.left > 0.0 && g.left >= g.right * kSideRatio) return Branch::LeftHeavy;
    if(g.right > 0.0 && g.right >= g.left * kSideRatio) return Branch::RightHeavy;
    if(g.front > 0.0 && g.front >= g.back * kFrontRatio) return Branch::FrontHeavy;
    return Branch::Balanced;
}

RuleClassifier::Decision RuleClassifier::classify(const FeatureVector& pressure) const{
    const Geometry g = measure(pressure);
    switch(branchOf(g)){
        case Branch::NoPressure:
            return {kPostureUpright, 0.5};
        case Branch::LeftHeavy:
            return {g.front > g.back ? kPostureLeftLegCrossed : kPostureLeftArmrest, dominance(g.left, g.right)};
        case Branch::RightHeavy:
            return {g.front > g.back ? kPostureRightLegCrossed : kPostureRightArmrest, dominance(g.right, g.left)};
        case Branch::FrontHeavy:
            return {g.headPeak > g.mean * kHeadPeakRatio ? kPostureTurtleNeck : kPostureHeadForward, dominance(g.front, g.back)};
        case Branch::Balanced:
            break;
    }
    const double balance = 1.0 - std::fabs(g.left - g.right) / g.total;
    return {kPostureUpright, clampConfidence(0.3 + balance)};
}

std::string RuleClassifier::reason(const FeatureVector& pressure) const{
    switch(branchOf(measure(pressure))){
        case Branch::NoPressure: return "no-pressure";
        case Branch::LeftHeavy: return "left-heavy";
        case Branch::RightHeavy: return "right-heavy";
        case Branch::FrontHeavy: return "front-heavy";
        case Branch::Balanced: return "balanced";
    }
    return "balanced";
}
