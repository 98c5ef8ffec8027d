#include "EnsembleClassifier.hpp"
#include "FeaturePreprocessor.hpp"
#include "ModelBundle.hpp"
#include "PostureLabels.hpp"
#include "PosturePolicy.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
// Offline replay: one frame per CSV line, pressure readings first, then
// optionally accel xyz and gyro xyz. Prints line,label,confidence,method,name.
static void split(const std::string& s, char d, std::vector<std::string>& out){ out.clear(); std::stringstream ss(s); std::string tok; while(std::getline(ss,tok,d)) out.push_back(tok); }
static bool parseRow(const std::vector<std::string>& tok, std::vector<double>& out){
    out.clear();
    for(const auto& t : tok){ char* end=nullptr; const double v=std::strtod(t.c_str(),&end); if(end==t.c_str()) return false; out.push_back(v); }
    return !out.empty();
}
int main(int argc, char** argv){
    std::string model_dir = argc>2 ? argv[2] : "models";
    std::string policy_path = argc>3 ? argv[3] : "config/posture.cfg";
    PosturePolicy policy; policy.load(policy_path);
    auto bundle = ModelBundle::load(model_dir, policy);
    for(const auto& r : bundle->loadReport()) std::cerr<<"[INFO] models: "<<r<<std::endl;
    EnsembleClassifier classifier(bundle, policy);
    for(const auto& w : classifier.startupWarnings()) std::cerr<<"[WARN] "<<w<<std::endl;
    std::istream* in = &std::cin; std::ifstream f;
    if(argc>1 && std::string(argv[1])!="-"){ f.open(argv[1]); if(!f){ std::cerr<<"[ERROR] cannot open "<<argv[1]<<std::endl; return 1; } in=&f; }
    std::string line; std::vector<std::string> tok; std::vector<double> row; long lineNo=0;
    const std::size_t nP = policy.pressureLength, nI = policy.inertialLength;
    while(std::getline(*in,line)){
        ++lineNo;
        if(line.empty()) continue;
        split(line, ',', tok);
        if(!parseRow(tok, row)) continue; // header or junk
        SensorFrame fr; fr.messageId = lineNo;
        if(row.size() >= nP + nI && nI == 6){
            fr.pressure.assign(row.begin(), row.begin()+nP);
            for(int i=0;i<3;++i){ fr.accel[i]=row[nP+i]; fr.gyro[i]=row[nP+3+i]; }
            fr.hasInertial = true;
        } else {
            fr.pressure = row;
        }
        std::vector<std::string> warnings; std::string err;
        if(!validatePressure(fr.pressure, warnings, err)){ std::cerr<<"[WARN] line "<<lineNo<<": "<<err<<std::endl; continue; }
        for(const auto& w : warnings) std::cerr<<"[WARN] line "<<lineNo<<": "<<w<<std::endl;
        const ClassificationResult r = classifier.classify(fr);
        for(const auto& d : r.diagnostics) std::cerr<<"[WARN] line "<<lineNo<<": "<<d<<std::endl;
        std::cout<<lineNo<<","<<r.label<<","<<r.confidence<<","<<methodTag(r.method)<<",\""<<postureName(r.label)<<"\""<<std::endl;
    }
    return 0;
}
