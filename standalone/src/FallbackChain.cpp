#include "FallbackChain.hpp"
#include <exception>
#include <utility>

FallbackChain& FallbackChain::add(std::string name, Stage stage){
    stages.emplace_back(std::move(name), std::move(stage));
    return *this;
}

int FallbackChain::run(ClassificationResult& out, std::vector<std::string>& errors) const{
    for(std::size_t i = 0; i < stages.size(); ++i){
        ClassificationResult candidate;
        std::string error;
        bool ok = false;
        try {
            ok = stages[i].second(candidate, error);
        } catch(const std::exception& e){
            ok = false;
            error = e.what();
        }
        if(ok){
            out = std::move(candidate);
            return static_cast<int>(i);
        }
        errors.insert(errors.end(), candidate.diagnostics.begin(), candidate.diagnostics.end());
        errors.push_back(stages[i].first + ": " + (error.empty() ? "failed" : error));
    }
    return -1;
}
