#include "TestUtil.hpp"
#include <atomic>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include <gtest/gtest.h>

std::string tempPath(const std::string& name){
    static std::atomic<int> counter{0};
    std::string dir = ::testing::TempDir();
    if(!dir.empty() && dir.back() != '/') dir += '/';
    return dir + "posture_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "_" + name;
}

std::string writeTempFile(const std::string& name, const std::string& contents){
    const std::string path = tempPath(name);
    std::ofstream out(path);
    out << contents;
    return path;
}

int ThrowingModel::predict(const FeatureVector&) const{
    throw std::runtime_error("model exploded");
}

std::vector<double> ThrowingModel::predictProbabilities(const FeatureVector&) const{
    throw std::runtime_error("model exploded");
}

std::vector<double> oneHot(int label, double p, std::size_t classes){
    std::vector<double> v(classes, classes > 1 ? (1.0 - p) / static_cast<double>(classes - 1) : 0.0);
    v[static_cast<std::size_t>(label)] = p;
    return v;
}

ClassificationRecord predictionAt(std::int64_t timestampMs, int label, double confidence, const std::string& deviceId){
    ClassificationRecord r;
    r.kind = RecordKind::Prediction;
    r.timestampMs = timestampMs;
    r.clientId = "client-a";
    r.deviceId = deviceId;
    r.label = label;
    r.confidence = confidence;
    r.method = ClassificationMethod::EnsembleStage1;
    r.processingMs = 1.5;
    return r;
}
