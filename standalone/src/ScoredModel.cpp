#include "ScoredModel.hpp"
#include <stdexcept>

std::vector<double> ScoredModel::predictProbabilities(const FeatureVector&) const{
    throw std::logic_error("model does not provide class probabilities");
}
