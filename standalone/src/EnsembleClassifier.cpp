#include "EnsembleClassifier.hpp"
#include "FallbackChain.hpp"
#include "FeaturePreprocessor.hpp"
#include "PostureLabels.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>

namespace {

constexpr double kPointModelConfidence = 0.7;
constexpr double kMajorityConfidence = 0.6;
constexpr double kDefaultConfidence = 0.5;

double clampConfidence(double c){ return std::max(0.3, std::min(0.95, c)); }

std::mt19937& rng(){
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

}  // namespace

EnsembleClassifier::EnsembleClassifier(std::shared_ptr<const ModelBundle> bundle, PosturePolicy policy)
: models(bundle ? std::move(bundle) : std::make_shared<const ModelBundle>()), pol(std::move(policy)) {
    for(int stage = 1; stage <= 2; ++stage){
        const StageModels& sm = models->stage(stage);
        if(!sm.models.empty() && !sm.scaler){
            warnings.push_back("stage " + std::to_string(stage) + " scaler not loaded; models see raw features");
        }
    }
    if(models->stage(1).models.empty()){
        warnings.push_back("no stage 1 models loaded; using the rule-based classifier");
    }
}

bool EnsembleClassifier::vote(int stage, const FeatureVector& features, ClassificationResult& out, std::string& error) const{
    const StageModels& sm = models->stage(stage);
    if(sm.models.empty()){
        error = "no stage " + std::to_string(stage) + " models loaded";
        return false;
    }
    const FeatureVector x = sm.scaler ? sm.scaler->transform(features) : features;
    const std::size_t K = static_cast<std::size_t>(pol.classCount);

    std::vector<double> scores(K, 0.0);
    std::vector<int> raw;
    std::size_t succeeded = 0;
    for(const ModelSlot& slot : sm.models){
        try {
            const int label = slot.model->predict(x);
            double confidence = kPointModelConfidence;
            if(slot.model->probabilistic()){
                const std::vector<double> p = slot.model->predictProbabilities(x);
                if(p.size() != K) throw std::runtime_error("returned " + std::to_string(p.size()) + " probabilities");
                for(std::size_t k = 0; k < K; ++k) scores[k] += slot.weight * p[k];
                confidence = *std::max_element(p.begin(), p.end());
            } else if(label >= 0 && static_cast<std::size_t>(label) < K){
                scores[label] += slot.weight;
            }
            if(label >= 0 && static_cast<std::size_t>(label) < K) raw.push_back(label);
            out.breakdown.push_back(ModelVote{stage, slot.name, label, confidence});
            ++succeeded;
        } catch(const std::exception& e){
            out.diagnostics.push_back("stage " + std::to_string(stage) + " model " + slot.name + " skipped: " + e.what());
        }
    }
    if(succeeded == 0){
        error = "every stage " + std::to_string(stage) + " model failed";
        return false;
    }

    double sum = 0.0;
    bool allZero = true;
    for(double s : scores){ sum += s; if(s != 0.0) allZero = false; }

    if(allZero || sum <= 0.0){
        if(raw.empty()){
            out.label = kPostureUpright;
            out.confidence = kDefaultConfidence;
        } else {
            std::map<int, int> counts;
            for(int r : raw) ++counts[r];
            // std::map iterates in label order, so ties go to the lower label
            auto best = counts.begin();
            for(auto it = counts.begin(); it != counts.end(); ++it){ if(it->second > best->second) best = it; }
            out.label = best->first;
            out.confidence = kMajorityConfidence;
        }
    } else {
        const auto win = std::max_element(scores.begin(), scores.end());
        out.label = static_cast<int>(win - scores.begin());
        out.confidence = clampConfidence(*win / sum);
    }
    out.votingScores = std::move(scores);
    return true;
}

bool EnsembleClassifier::predictStage1(const FeatureVector& pressure, ClassificationResult& out, std::string& error) const{
    out.method = ClassificationMethod::EnsembleStage1;
    return vote(1, normalizeFeatures(pressure, pol.pressureLength), out, error);
}

bool EnsembleClassifier::predictStage2(const FeatureVector& inertial, ClassificationResult& out, std::string& error) const{
    out.method = ClassificationMethod::EnsembleStage1PlusStage2;
    return vote(2, normalizeFeatures(inertial, pol.inertialLength), out, error);
}

bool EnsembleClassifier::predictCascade(const SensorFrame& frame, ClassificationResult& out, std::string& error) const{
    if(!predictStage1(frame.pressure, out, error)) return false;
    if(!pol.isAmbiguous(out.label) || !frame.hasInertial || models->stage(2).models.empty()) return true;

    ClassificationResult refined;
    std::string stage2Error;
    bool refinedOk = false;
    try {
        refinedOk = predictStage2(frame.inertial(), refined, stage2Error);
    } catch(const std::exception& e){
        stage2Error = e.what();
    }
    if(!refinedOk){
        out.diagnostics.insert(out.diagnostics.end(), refined.diagnostics.begin(), refined.diagnostics.end());
        out.diagnostics.push_back("stage 2 ignored: " + stage2Error);
        return true;
    }
    out.stage2Evaluated = true;
    out.breakdown.insert(out.breakdown.end(), refined.breakdown.begin(), refined.breakdown.end());
    out.diagnostics.insert(out.diagnostics.end(), refined.diagnostics.begin(), refined.diagnostics.end());
    if(refined.label != kPostureUpright && refined.confidence > pol.stage2OverrideConfidence){
        out.label = refined.label;
        out.confidence = refined.confidence;
        out.votingScores = std::move(refined.votingScores);
        out.method = ClassificationMethod::EnsembleStage1PlusStage2;
    }
    return true;
}

bool EnsembleClassifier::predictRuleBased(const FeatureVector& pressure, ClassificationResult& out, std::string& error) const{
    for(double v : pressure){
        if(!std::isfinite(v)){
            error = "pressure contains a non-finite reading";
            return false;
        }
    }
    const RuleClassifier::Decision d = rules.classify(normalizeFeatures(pressure, pol.pressureLength));
    out.label = d.label;
    out.confidence = d.confidence;
    out.method = ClassificationMethod::RuleBased;
    out.votingScores.assign(static_cast<std::size_t>(pol.classCount), 0.0);
    if(d.label >= 0 && d.label < pol.classCount) out.votingScores[d.label] = d.confidence;
    out.breakdown.push_back(ModelVote{1, "rule_based", d.label, d.confidence});
    return true;
}

ClassificationResult EnsembleClassifier::degraded() const{
    std::uniform_int_distribution<int> label(0, pol.classCount - 1);
    std::uniform_real_distribution<double> confidence(0.4, 0.8);
    ClassificationResult r;
    r.label = label(rng());
    r.confidence = confidence(rng());
    r.method = ClassificationMethod::DegradedRandom;
    r.votingScores.assign(static_cast<std::size_t>(pol.classCount), 0.0);
    return r;
}

ClassificationResult EnsembleClassifier::classify(const SensorFrame& frame) const{
    const auto start = std::chrono::steady_clock::now();

    FallbackChain chain;
    chain.add("ensemble", [&](ClassificationResult& r, std::string& e){ return predictCascade(frame, r, e); })
         .add("rule_based", [&](ClassificationResult& r, std::string& e){ return predictRuleBased(frame.pressure, r, e); });

    ClassificationResult result;
    std::vector<std::string> errors;
    const int used = chain.run(result, errors);
    if(used < 0){
        result = degraded();
        errors.push_back("every classifier failed; answering with a random label");
    }
    // Falling back to the rules is routine when no models were shipped.
    const bool routine = used == 1 && models->stage(1).models.empty();
    if(used != 0 && !routine){
        result.diagnostics.insert(result.diagnostics.begin(), errors.begin(), errors.end());
    }

    result.processingMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return result;
}
