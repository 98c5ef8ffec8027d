#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ClassificationResult.hpp"
#include "SensorFrame.hpp"

// Wire error payload. id echoes the request id once the message parsed far
// enough to have one.
struct FrameError {
    nlohmann::json id = "unknown";
    std::string error;
    std::string details;
};

// Parses one inbound JSON message. Returns false and fills err on any
// validation failure; recoverable oddities (negative pressure, malformed IMU
// block) are reported through warnings.
bool decodeFrame(const std::string& text, SensorFrame& frame, FrameError& err, std::vector<std::string>& warnings);

std::string encodeResponse(const SensorFrame& frame, const ClassificationResult& result);
std::string encodeError(const FrameError& err);
