#pragma once
#include <memory>
#include <string>
#include <vector>
#include "PosturePolicy.hpp"
#include "Scaler.hpp"
#include "ScoredModel.hpp"

struct ModelSlot {
    std::string name;
    double weight;
    std::shared_ptr<const ScoredModel> model;
};

struct StageModels {
    std::vector<ModelSlot> models;
    std::shared_ptr<const Scaler> scaler;  // null when no transform was loaded
};

// Every trained artifact the cascade consults, loaded once at startup and
// shared read-only afterwards. Individual load failures are recorded in the
// report and never abort the load.
class ModelBundle {
public:
    static constexpr const char* kManifestName = "models.cfg";

    // Reads <dir>/models.cfg. A missing manifest yields an empty bundle.
    static std::shared_ptr<ModelBundle> load(const std::string& dir, const PosturePolicy& policy);

    void addModel(int stage, const std::string& name, double weight, std::shared_ptr<const ScoredModel> model);
    void setScaler(int stage, std::shared_ptr<const Scaler> scaler);

    const StageModels& stage(int stage) const { return stage == 2 ? inertial : pressure; }
    const std::vector<std::string>& loadReport() const { return report; }
    std::size_t failureCount() const { return failures; }

private:
    StageModels& mutableStage(int stage) { return stage == 2 ? inertial : pressure; }
    void fail(const std::string& what);

    StageModels pressure;
    StageModels inertial;
    std::vector<std::string> report;
    std::size_t failures = 0;
};

// Vote weight used when the manifest does not give one.
double defaultModelWeight(const std::string& name);
