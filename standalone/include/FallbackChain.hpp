#pragma once
#include <functional>
#include <string>
#include <vector>
#include "ClassificationResult.hpp"

// Ordered list of classification strategies. run() returns the first stage
// that succeeds; a stage fails by returning false or by throwing.
class FallbackChain {
public:
    using Stage = std::function<bool(ClassificationResult& out, std::string& error)>;

    FallbackChain& add(std::string name, Stage stage);

    // Index of the stage that produced out, or -1 when every stage failed.
    // Each failed stage appends its diagnostics and a "<stage>: <error>" line.
    int run(ClassificationResult& out, std::vector<std::string>& errors) const;

    std::size_t size() const { return stages.size(); }

private:
    std::vector<std::pair<std::string, Stage>> stages;
};
