#include "LinearModel.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

bool LinearModel::load(const std::string& path){
    std::ifstream in(path);
    if(!in) return false;
    weights.clear(); dims = 0;
    std::string tag; int K=0, D=0, proba=0;
    if(!(in>>tag>>K>>D>>proba) || tag!="linear" || K<=0 || D<=0) return false;
    std::vector<std::vector<double>> w(K, std::vector<double>(D + 1, 0.0));
    for(auto& row:w){
        for(double& v:row){ if(!(in>>v)) return false; }
    }
    weights = std::move(w);
    dims = static_cast<std::size_t>(D);
    withProba = proba != 0;
    return true;
}

std::vector<double> LinearModel::margins(const FeatureVector& x) const{
    if(weights.empty()) throw std::runtime_error("linear model is not loaded");
    if(x.size() != dims) throw std::runtime_error("linear model expects " + std::to_string(dims) + " features, got " + std::to_string(x.size()));
    std::vector<double> m(weights.size(), 0.0);
    for(std::size_t k=0;k<weights.size();++k){
        double z = weights[k][dims];
        for(std::size_t j=0;j<dims;++j) z += weights[k][j]*x[j];
        m[k] = z;
    }
    return m;
}

int LinearModel::predict(const FeatureVector& x) const{
    const auto m = margins(x);
    return static_cast<int>(std::max_element(m.begin(), m.end()) - m.begin());
}

std::vector<double> LinearModel::predictProbabilities(const FeatureVector& x) const{
    if(!withProba) return ScoredModel::predictProbabilities(x);
    auto m = margins(x);
    const double top = *std::max_element(m.begin(), m.end());
    double Z = 0;
    for(double& v:m){ v = std::exp(v - top); Z += v; }
    for(double& v:m) v /= Z;
    return m;
}
