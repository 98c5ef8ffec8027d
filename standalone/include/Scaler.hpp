#pragma once
#include <string>
#include <vector>
#include "SensorFrame.hpp"

// Per-feature standardization fitted at training time: (x - mean) / scale.
class Scaler {
public:
    bool load(const std::string& path);
    FeatureVector transform(const FeatureVector& x) const;
    std::size_t length() const { return mean.size(); }

private:
    std::vector<double> mean, scale;
};
