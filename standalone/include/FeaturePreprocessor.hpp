#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "SensorFrame.hpp"

// Right-pads with zeros or truncates so every model sees exactly expectedLength values.
FeatureVector normalizeFeatures(const std::vector<double>& raw, std::size_t expectedLength);

// Input gate for a pressure vector. Empty or non-finite input is rejected;
// negative readings only produce warnings (noisy hardware).
bool validatePressure(const std::vector<double>& values, std::vector<std::string>& warnings, std::string& error);
