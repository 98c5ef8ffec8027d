#include "ClassificationResult.hpp"

const char* methodTag(ClassificationMethod method){
    switch(method){
        case ClassificationMethod::RuleBased: return "rule_based";
        case ClassificationMethod::EnsembleStage1: return "ensemble_stage1";
        case ClassificationMethod::EnsembleStage1PlusStage2: return "ensemble_stage1_plus_stage2";
        case ClassificationMethod::DegradedRandom: return "degraded_random";
    }
    return "rule_based";
}

bool parseMethodTag(const std::string& tag, ClassificationMethod& method){
    if(tag == "rule_based") method = ClassificationMethod::RuleBased;
    else if(tag == "ensemble_stage1") method = ClassificationMethod::EnsembleStage1;
    else if(tag == "ensemble_stage1_plus_stage2") method = ClassificationMethod::EnsembleStage1PlusStage2;
    else if(tag == "degraded_random") method = ClassificationMethod::DegradedRandom;
    else return false;
    return true;
}
