#include "Forest.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::vector<double> Forest::proba(const FeatureVector& x) const{
    if(trees.empty()) throw std::runtime_error("forest has no trees");
    std::vector<double> acc(classes, 0.0);
    for(const auto& t:trees){
        std::size_t i=0, hops=0;
        while(!t.n[i].leaf){
            const auto& nd = t.n[i];
            if(nd.f < 0 || static_cast<std::size_t>(nd.f) >= x.size()){
                std::ostringstream s; s<<"forest split on feature "<<nd.f<<" but input has "<<x.size();
                throw std::runtime_error(s.str());
            }
            const int next = (x[nd.f] <= nd.t) ? nd.l : nd.r;
            if(next < 0 || static_cast<std::size_t>(next) >= t.n.size() || ++hops > t.n.size())
                throw std::runtime_error("forest tree is malformed");
            i = static_cast<std::size_t>(next);
        }
        for(std::size_t k=0;k<classes;++k) acc[k]+=t.n[i].p[k];
    }
    double Z = 0;
    for(double a:acc) Z+=a;
    if(Z<=0) return std::vector<double>(classes, 1.0/static_cast<double>(classes));
    for(double& a:acc) a/=Z;
    return acc;
}

int Forest::predict(const FeatureVector& x) const{
    const auto p = proba(x);
    return static_cast<int>(std::max_element(p.begin(), p.end()) - p.begin());
}

bool Forest::load(const std::string& path){
    std::ifstream in(path);
    if(!in) return false;
    trees.clear(); classes = 0;
    std::string tag; int T=0, K=0;
    if(!(in>>tag>>T>>K) || tag!="forest" || T<=0 || K<=0) return false;
    for(int t=0;t<T;++t){
        std::string tt; int N=0;
        if(!(in>>tt>>N) || tt!="tree" || N<=0) { trees.clear(); return false; }
        ForestTree tr; tr.n.resize(N);
        for(int i=0;i<N;++i){
            int idx,f,l,r; double th;
            if(!(in>>idx>>f>>th>>l>>r)) { trees.clear(); return false; }
            ForestNode& nd = tr.n[i];
            nd.f=f; nd.t=th; nd.l=l; nd.r=r;
            nd.leaf = (l<0 && r<0);
            nd.p.assign(K, 0.0);
            for(int k=0;k<K;++k){ if(!(in>>nd.p[k])) { trees.clear(); return false; } }
        }
        trees.push_back(std::move(tr));
    }
    classes = static_cast<std::size_t>(K);
    return true;
}
