#pragma once
#include <string>
#include <vector>

enum class ClassificationMethod {
    RuleBased,
    EnsembleStage1,
    EnsembleStage1PlusStage2,
    DegradedRandom,
};

const char* methodTag(ClassificationMethod method);
bool parseMethodTag(const std::string& tag, ClassificationMethod& method);

struct ModelVote {
    int stage{1};
    std::string model;
    int label{0};
    double confidence{0.0};
};

struct ClassificationResult {
    int label{0};
    double confidence{0.0};
    ClassificationMethod method{ClassificationMethod::RuleBased};
    std::vector<ModelVote> breakdown;
    std::vector<double> votingScores;
    bool stage2Evaluated{false};
    double processingMs{0.0};
    // Recovered failures (skipped models, fallbacks). Not persisted.
    std::vector<std::string> diagnostics;
};
