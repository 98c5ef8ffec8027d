#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Tunable constants of the classifier cascade and the daily score. Defaults
// reproduce the deployed behaviour; a key/value file may override any of them.
struct PosturePolicy {
    int classCount = 8;
    std::size_t pressureLength = 11;
    std::size_t inertialLength = 6;

    // Stage 2 may only move a result away from upright.
    double stage2OverrideConfidence = 0.6;
    std::vector<int> stage2Ambiguous{0, 4};

    double goodPostureMax = 60.0;
    double goodPostureFactor = 0.6;
    double penaltyCap = 40.0;
    double penaltyFactor = 0.15;
    std::vector<double> severity{0.0, 2.0, 2.0, 3.0, 4.0, 1.0, 1.0, 3.0};
    double idealSessionMin = 5.0;
    double idealSessionMax = 15.0;

    bool load(const std::string& path);
    double severityOf(int label) const;
    bool isAmbiguous(int label) const;
};
