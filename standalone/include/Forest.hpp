#pragma once
#include <vector>
#include <string>
#include "ScoredModel.hpp"

struct ForestNode { int f; double t; int l; int r; bool leaf; std::vector<double> p; };
struct ForestTree { std::vector<ForestNode> n; };

class Forest : public ScoredModel {
public:
    bool load(const std::string& path);
    std::vector<double> proba(const FeatureVector& x) const;

    int predict(const FeatureVector& x) const override;
    bool probabilistic() const override { return true; }
    std::vector<double> predictProbabilities(const FeatureVector& x) const override { return proba(x); }
    std::size_t classCount() const override { return classes; }

private:
    std::vector<ForestTree> trees;
    std::size_t classes = 0;
};
