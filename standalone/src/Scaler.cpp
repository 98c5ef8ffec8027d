#include "Scaler.hpp"
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

bool Scaler::load(const std::string& path){
    std::ifstream in(path);
    if(!in) return false;
    std::map<std::string, double> kv;
    std::string k; double v;
    while(in>>k>>v) kv[k] = v;
    const auto len = kv.find("length");
    if(len == kv.end() || len->second < 1) return false;
    const std::size_t D = static_cast<std::size_t>(len->second);
    std::vector<double> m(D, 0.0), s(D, 1.0);
    for(const auto& e:kv){
        const bool isMean = e.first.rfind("mean_", 0) == 0;
        const bool isScale = e.first.rfind("scale_", 0) == 0;
        if(!isMean && !isScale) continue;
        const std::string tail = e.first.substr(isMean ? 5 : 6);
        char* end = nullptr;
        const long i = std::strtol(tail.c_str(), &end, 10);
        if(end == tail.c_str() || *end != '\0' || i < 0 || static_cast<std::size_t>(i) >= D) return false;
        if(isMean) m[i] = e.second;
        else s[i] = (e.second == 0.0) ? 1.0 : e.second;
    }
    mean = std::move(m); scale = std::move(s);
    return true;
}

FeatureVector Scaler::transform(const FeatureVector& x) const{
    if(x.size() != mean.size())
        throw std::runtime_error("scaler expects " + std::to_string(mean.size()) + " features, got " + std::to_string(x.size()));
    FeatureVector out(x.size());
    for(std::size_t i=0;i<x.size();++i) out[i] = (x[i]-mean[i])/scale[i];
    return out;
}
