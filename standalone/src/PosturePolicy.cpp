#include "PosturePolicy.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace {

// Upper bounds on table sizes read from the file.
constexpr int kMaxClassCount = 256;
constexpr double kMaxFeatureLength = 4096.0;

bool suffixIndex(const std::string& key, const std::string& prefix, int& index){
    if(key.compare(0, prefix.size(), prefix) != 0 || key.size() == prefix.size()) return false;
    char* end = nullptr;
    const std::string tail = key.substr(prefix.size());
    const long v = std::strtol(tail.c_str(), &end, 10);
    if(end == tail.c_str() || *end != '\0' || v < 0 || v >= kMaxClassCount) return false;
    index = static_cast<int>(v);
    return true;
}

}  // namespace

bool PosturePolicy::load(const std::string& path){
    std::ifstream in(path);
    if(!in) return false;
    std::vector<int> ambiguous;
    bool sawAmbiguous = false;
    std::string line;
    while(std::getline(in, line)){
        const auto hash = line.find('#');
        if(hash != std::string::npos) line.erase(hash);
        std::istringstream ls(line);
        std::string k; double v;
        if(!(ls >> k >> v)) continue;
        int idx = 0;
        if(k == "class_count"){
            if(v >= 1 && v <= kMaxClassCount) classCount = static_cast<int>(v);
        }
        else if(k == "pressure_length"){
            if(v >= 1 && v <= kMaxFeatureLength) pressureLength = static_cast<std::size_t>(v);
        }
        else if(k == "inertial_length"){
            if(v >= 1 && v <= kMaxFeatureLength) inertialLength = static_cast<std::size_t>(v);
        }
        else if(k == "stage2_override_confidence") stage2OverrideConfidence = v;
        else if(k == "good_posture_max") goodPostureMax = v;
        else if(k == "good_posture_factor") goodPostureFactor = v;
        else if(k == "penalty_cap") penaltyCap = v;
        else if(k == "penalty_factor") penaltyFactor = v;
        else if(k == "ideal_session_min") idealSessionMin = v;
        else if(k == "ideal_session_max") idealSessionMax = v;
        else if(suffixIndex(k, "severity_", idx)){
            if(static_cast<std::size_t>(idx) >= severity.size()) severity.resize(idx + 1, 1.0);
            severity[idx] = v;
        }
        else if(suffixIndex(k, "stage2_ambiguous_", idx)){
            sawAmbiguous = true;
            if(v != 0.0) ambiguous.push_back(idx);
        }
    }
    if(sawAmbiguous) stage2Ambiguous = ambiguous;
    if(severity.size() < static_cast<std::size_t>(classCount)) severity.resize(classCount, 1.0);
    return true;
}

double PosturePolicy::severityOf(int label) const{
    if(label < 0 || static_cast<std::size_t>(label) >= severity.size()) return 1.0;
    return severity[label];
}

bool PosturePolicy::isAmbiguous(int label) const{
    return std::find(stage2Ambiguous.begin(), stage2Ambiguous.end(), label) != stage2Ambiguous.end();
}
