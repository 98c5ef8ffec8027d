#include "PostureLabels.hpp"

std::string postureName(int label){
    switch(label){
        case kPostureUpright: return "upright";
        case kPostureRightLegCrossed: return "right leg crossed";
        case kPostureLeftLegCrossed: return "left leg crossed";
        case kPostureSlouched: return "slouched, hips forward";
        case kPostureTurtleNeck: return "turtle neck";
        case kPostureRightArmrest: return "leaning on right armrest";
        case kPostureLeftArmrest: return "leaning on left armrest";
        case kPostureHeadForward: return "head forward";
        default: return "unknown_" + std::to_string(label);
    }
}
