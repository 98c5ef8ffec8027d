#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ClassificationResult.hpp"
#include "ModelBundle.hpp"
#include "PosturePolicy.hpp"
#include "RuleClassifier.hpp"
#include "SensorFrame.hpp"

// Two-stage cascade: a pressure ensemble, optionally refined by an inertial
// ensemble for the labels pressure alone confuses. classify() never fails;
// it falls back to the rule classifier and, as a last resort, to a random
// answer tagged ClassificationMethod::DegradedRandom.
class EnsembleClassifier {
public:
    EnsembleClassifier(std::shared_ptr<const ModelBundle> bundle, PosturePolicy policy);

    bool predictStage1(const FeatureVector& pressure, ClassificationResult& out, std::string& error) const;
    bool predictStage2(const FeatureVector& inertial, ClassificationResult& out, std::string& error) const;

    // Stage 1, then the stage-2 override when the cascade conditions hold.
    bool predictCascade(const SensorFrame& frame, ClassificationResult& out, std::string& error) const;
    // Fails only on non-finite readings.
    bool predictRuleBased(const FeatureVector& pressure, ClassificationResult& out, std::string& error) const;

    ClassificationResult classify(const SensorFrame& frame) const;

    // Configuration problems noticed at construction (missing scalers...).
    const std::vector<std::string>& startupWarnings() const { return warnings; }
    const PosturePolicy& policy() const { return pol; }
    const ModelBundle& bundle() const { return *models; }

private:
    bool vote(int stage, const FeatureVector& features, ClassificationResult& out, std::string& error) const;
    ClassificationResult degraded() const;

    std::shared_ptr<const ModelBundle> models;
    PosturePolicy pol;
    RuleClassifier rules;
    std::vector<std::string> warnings;
};
