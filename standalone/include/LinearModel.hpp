#pragma once
#include <string>
#include <vector>
#include "ScoredModel.hpp"

// One-vs-rest linear scorer. Files written with "proba 1" expose softmax
// probabilities; "proba 0" models are point predictors.
class LinearModel : public ScoredModel {
public:
    bool load(const std::string& path);
    std::vector<double> margins(const FeatureVector& x) const;

    int predict(const FeatureVector& x) const override;
    bool probabilistic() const override { return withProba; }
    std::vector<double> predictProbabilities(const FeatureVector& x) const override;
    std::size_t classCount() const override { return weights.size(); }

private:
    std::vector<std::vector<double>> weights;  // K rows of D weights + bias
    std::size_t dims = 0;
    bool withProba = false;
};
