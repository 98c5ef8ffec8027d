#include "FrameCodec.hpp"
#include "FeaturePreprocessor.hpp"
#include <cmath>
#include <utility>

using nlohmann::json;

namespace {

bool readTriple(const json& j, const char* key, std::array<double, 3>& out){
    const auto it = j.find(key);
    if(it == j.end() || !it->is_array() || it->size() != 3) return false;
    for(std::size_t i = 0; i < 3; ++i){
        if(!(*it)[i].is_number()) return false;
        out[i] = (*it)[i].get<double>();
    }
    return true;
}

bool fail(FrameError& err, const char* error, std::string details){
    err.error = error;
    err.details = std::move(details);
    return false;
}

}  // namespace

bool decodeFrame(const std::string& text, SensorFrame& frame, FrameError& err, std::vector<std::string>& warnings){
    err = FrameError{};
    const json j = json::parse(text, nullptr, false);
    if(j.is_discarded()) return fail(err, "Invalid JSON", "message is not valid JSON");
    if(!j.is_object()) return fail(err, "Invalid message", "message must be a JSON object");

    const auto id = j.find("id");
    if(id != j.end()) err.id = *id;
    if(id == j.end()) return fail(err, "Missing field", "'id' is required");
    if(!id->is_number_integer()) return fail(err, "Invalid field", "'id' must be an integer");

    const auto device = j.find("device_id");
    if(device == j.end()) return fail(err, "Missing field", "'device_id' is required");
    if(!device->is_string()) return fail(err, "Invalid field", "'device_id' must be a string");

    const auto fsr = j.find("FSR");
    if(fsr == j.end()) return fail(err, "Missing field", "'FSR' is required");
    if(!fsr->is_array()) return fail(err, "Invalid field", "'FSR' must be an array");

    SensorFrame f;
    f.messageId = id->get<std::int64_t>();
    f.deviceId = device->get<std::string>();
    f.pressure.reserve(fsr->size());
    for(const auto& v : *fsr){
        if(!v.is_number()) return fail(err, "Invalid field", "'FSR' must contain only numbers");
        f.pressure.push_back(v.get<double>());
    }
    std::string reason;
    if(!validatePressure(f.pressure, warnings, reason)) return fail(err, "Invalid field", reason);

    const auto imu = j.find("IMU");
    if(imu != j.end() && !imu->is_null()){
        if(imu->is_object() && readTriple(*imu, "accel", f.accel) && readTriple(*imu, "gyro", f.gyro)){
            f.hasInertial = true;
        } else {
            f.accel = {{0.0, 0.0, 0.0}};
            f.gyro = {{0.0, 0.0, 0.0}};
            warnings.push_back("malformed IMU block ignored");
        }
    }
    frame = std::move(f);
    return true;
}

std::string encodeResponse(const SensorFrame& frame, const ClassificationResult& result){
    const json j = {
        {"id", frame.messageId},
        {"posture", result.label},
        {"confidence", std::round(result.confidence * 1000.0) / 1000.0},
    };
    return j.dump();
}

std::string encodeError(const FrameError& err){
    const json j = {
        {"id", err.id},
        {"error", err.error},
        {"details", err.details},
    };
    return j.dump();
}
