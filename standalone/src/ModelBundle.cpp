#include "ModelBundle.hpp"
#include "Forest.hpp"
#include "LinearModel.hpp"
#include <fstream>
#include <sstream>

namespace {

struct DefaultWeight { const char* name; double weight; };

constexpr DefaultWeight kDefaultWeights[] = {
    {"rf", 0.4},
    {"gb", 0.3},
    {"lr", 0.15},
    {"svm", 0.15},
};

std::string joinPath(const std::string& dir, const std::string& file){
    if(file.empty() || file[0] == '/' || dir.empty()) return file;
    return dir.back() == '/' ? dir + file : dir + "/" + file;
}

}  // namespace

double defaultModelWeight(const std::string& name){
    for(const auto& w:kDefaultWeights){
        if(name == w.name) return w.weight;
    }
    return 1.0;
}

void ModelBundle::addModel(int stage, const std::string& name, double weight, std::shared_ptr<const ScoredModel> model){
    mutableStage(stage).models.push_back(ModelSlot{name, weight, std::move(model)});
}

void ModelBundle::setScaler(int stage, std::shared_ptr<const Scaler> scaler){
    mutableStage(stage).scaler = std::move(scaler);
}

void ModelBundle::fail(const std::string& what){
    report.push_back("failed: " + what);
    ++failures;
}

std::shared_ptr<ModelBundle> ModelBundle::load(const std::string& dir, const PosturePolicy& policy){
    auto bundle = std::make_shared<ModelBundle>();
    const std::string manifest = joinPath(dir, kManifestName);
    std::ifstream in(manifest);
    if(!in){
        bundle->report.push_back("no manifest at " + manifest + "; rule-based classification only");
        return bundle;
    }
    std::string line;
    int lineNo = 0;
    while(std::getline(in, line)){
        ++lineNo;
        const auto hash = line.find('#');
        if(hash != std::string::npos) line.erase(hash);
        std::istringstream ls(line);
        std::string stageTag, kind, name, file;
        if(!(ls >> stageTag)) continue;
        if(!(ls >> kind >> name >> file)){
            bundle->fail(manifest + ":" + std::to_string(lineNo) + " expects <stage> <kind> <name> <file> [weight]");
            continue;
        }
        const int stage = stageTag == "stage1" ? 1 : (stageTag == "stage2" ? 2 : 0);
        if(stage == 0){
            bundle->fail(manifest + ":" + std::to_string(lineNo) + " unknown stage '" + stageTag + "'");
            continue;
        }
        const std::size_t expected = stage == 1 ? policy.pressureLength : policy.inertialLength;
        const std::string path = joinPath(dir, file);

        if(kind == "scaler"){
            auto scaler = std::make_shared<Scaler>();
            if(!scaler->load(path)) { bundle->fail(stageTag + " scaler " + path); continue; }
            if(scaler->length() != expected){
                bundle->fail(stageTag + " scaler " + path + " has length " + std::to_string(scaler->length()) +
                             ", expected " + std::to_string(expected));
                continue;
            }
            bundle->setScaler(stage, scaler);
            bundle->report.push_back("loaded " + stageTag + " scaler " + path);
            continue;
        }

        double weight = 0.0;
        if(!(ls >> weight)) weight = defaultModelWeight(name);

        std::shared_ptr<ScoredModel> model;
        if(kind == "forest"){
            auto f = std::make_shared<Forest>();
            if(f->load(path)) model = f;
        } else if(kind == "linear"){
            auto l = std::make_shared<LinearModel>();
            if(l->load(path)) model = l;
        } else {
            bundle->fail(stageTag + " model " + name + ": unknown kind '" + kind + "'");
            continue;
        }
        if(!model){ bundle->fail(stageTag + " model " + name + " from " + path); continue; }
        if(model->classCount() != static_cast<std::size_t>(policy.classCount)){
            bundle->fail(stageTag + " model " + name + " scores " + std::to_string(model->classCount()) +
                         " classes, expected " + std::to_string(policy.classCount));
            continue;
        }
        bundle->addModel(stage, name, weight, model);
        std::ostringstream s;
        s << "loaded " << stageTag << " model " << name << " (" << kind << (model->probabilistic() ? ", probabilistic" : ", point")
          << ", weight " << weight << ")";
        bundle->report.push_back(s.str());
    }
    return bundle;
}
