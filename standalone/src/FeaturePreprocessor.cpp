#include "FeaturePreprocessor.hpp"
#include <cmath>
#include <sstream>

FeatureVector normalizeFeatures(const std::vector<double>& raw, std::size_t expectedLength){
    FeatureVector out(expectedLength, 0.0);
    const std::size_t copyN = raw.size() < expectedLength ? raw.size() : expectedLength;
    for(std::size_t i = 0; i < copyN; ++i){ out[i] = raw[i]; }
    return out;
}

bool validatePressure(const std::vector<double>& values, std::vector<std::string>& warnings, std::string& error){
    if(values.empty()){
        error = "pressure vector is empty";
        return false;
    }
    for(std::size_t i = 0; i < values.size(); ++i){
        if(!std::isfinite(values[i])){
            std::ostringstream s; s << "pressure[" << i << "] is not a finite number";
            error = s.str();
            return false;
        }
        if(values[i] < 0.0){
            std::ostringstream s; s << "negative pressure reading " << values[i] << " at index " << i;
            warnings.push_back(s.str());
        }
    }
    return true;
}
