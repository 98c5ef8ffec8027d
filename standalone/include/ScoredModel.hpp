#pragma once
#include <cstddef>
#include <vector>
#include "SensorFrame.hpp"

// A trained classifier loaded from disk. Immutable after load, so one
// instance may be shared by every connection thread without locking.
// Implementations throw std::runtime_error when they cannot score an input.
class ScoredModel {
public:
    virtual ~ScoredModel() = default;

    virtual int predict(const FeatureVector& x) const = 0;
    // Point predictors return false and only vote with predict().
    virtual bool probabilistic() const = 0;
    // Length equals classCount(). Throws std::logic_error on point predictors.
    virtual std::vector<double> predictProbabilities(const FeatureVector& x) const;
    virtual std::size_t classCount() const = 0;
};
