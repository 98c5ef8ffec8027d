#include "ClassificationLog.hpp"
#include "TimeUtil.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace {

constexpr std::size_t kColumns = 10;

void splitOn(const std::string& line, char sep, std::vector<std::string>& out){
    out.clear();
    std::size_t start = 0;
    while (start <= line.size()) {
        const auto pos = line.find(sep, start);
        if (pos == std::string::npos) {
            out.emplace_back(line.substr(start));
            break;
        }
        out.emplace_back(line.substr(start, pos - start));
        start = pos + 1;
    }
}

bool parseDouble(const std::string& token, double& value){
    char* end = nullptr;
    value = std::strtod(token.c_str(), &end);
    return end != token.c_str() && *end == '\0';
}

bool parseInt64(const std::string& token, std::int64_t& value){
    char* end = nullptr;
    value = std::strtoll(token.c_str(), &end, 10);
    return end != token.c_str() && *end == '\0';
}

// Identifiers end up inside CSV cells and breakdown entries.
std::string sanitize(const std::string& text){
    std::string out = text;
    for(char& c : out){
        if(c == ',' || c == '\n' || c == '\r' || c == '|' || c == ':') c = '_';
    }
    return out;
}

const char* kindTag(RecordKind kind){
    switch(kind){
        case RecordKind::Prediction: return "prediction";
        case RecordKind::Connect: return "connect";
        case RecordKind::Disconnect: return "disconnect";
    }
    return "prediction";
}

bool parseKind(const std::string& tag, RecordKind& kind){
    if(tag == "prediction") kind = RecordKind::Prediction;
    else if(tag == "connect") kind = RecordKind::Connect;
    else if(tag == "disconnect") kind = RecordKind::Disconnect;
    else return false;
    return true;
}

bool matches(const ClassificationRecord& r, const LogQuery& q){
    if(q.predictionsOnly && r.kind != RecordKind::Prediction) return false;
    if(!q.deviceId.empty() && r.deviceId != sanitize(q.deviceId)) return false;
    if(q.startDate.empty() && q.endDate.empty()) return true;
    const std::string day = utcDate(r.timestampMs);
    if(!q.startDate.empty() && day < q.startDate) return false;
    if(!q.endDate.empty() && day > q.endDate) return false;
    return true;
}

}  // namespace

ClassificationRecord predictionRecord(const std::string& clientId, const std::string& deviceId,
                                      std::int64_t timestampMs, const ClassificationResult& result){
    ClassificationRecord r;
    r.kind = RecordKind::Prediction;
    r.timestampMs = timestampMs;
    r.clientId = clientId;
    r.deviceId = deviceId;
    r.label = result.label;
    r.confidence = result.confidence;
    r.method = result.method;
    r.processingMs = result.processingMs;
    r.breakdown = result.breakdown;
    r.votingScores = result.votingScores;
    return r;
}

ClassificationRecord connectionRecord(RecordKind kind, const std::string& clientId, std::int64_t timestampMs){
    ClassificationRecord r;
    r.kind = kind;
    r.timestampMs = timestampMs;
    r.clientId = clientId;
    return r;
}

CsvClassificationLog::CsvClassificationLog(std::string path) : file(std::move(path)) {}

std::string CsvClassificationLog::encode(const ClassificationRecord& r){
    std::ostringstream s;
    s.precision(6);
    s << kindTag(r.kind) << ',' << r.timestampMs << ',' << sanitize(r.clientId) << ',' << sanitize(r.deviceId) << ',';
    if(r.kind != RecordKind::Prediction){
        s << ",,,,,";
        return s.str();
    }
    s << r.label << ',' << r.confidence << ',' << methodTag(r.method) << ',' << r.processingMs << ',';
    for(std::size_t i = 0; i < r.breakdown.size(); ++i){
        const ModelVote& v = r.breakdown[i];
        if(i) s << '|';
        s << v.stage << ':' << sanitize(v.model) << ':' << v.label << ':' << v.confidence;
    }
    s << ',';
    for(std::size_t i = 0; i < r.votingScores.size(); ++i){
        if(i) s << '|';
        s << r.votingScores[i];
    }
    return s.str();
}

bool CsvClassificationLog::decode(const std::string& line, ClassificationRecord& r){
    std::vector<std::string> tok;
    splitOn(line, ',', tok);
    if(tok.size() != kColumns) return false;
    r = ClassificationRecord{};
    if(!parseKind(tok[0], r.kind) || !parseInt64(tok[1], r.timestampMs)) return false;
    r.clientId = tok[2];
    r.deviceId = tok[3];
    if(r.kind != RecordKind::Prediction) return true;

    std::int64_t label = 0;
    if(!parseInt64(tok[4], label) || !parseDouble(tok[5], r.confidence) ||
       !parseMethodTag(tok[6], r.method) || !parseDouble(tok[7], r.processingMs)) return false;
    r.label = static_cast<int>(label);

    std::vector<std::string> entries, fields;
    if(!tok[8].empty()){
        splitOn(tok[8], '|', entries);
        for(const auto& e : entries){
            splitOn(e, ':', fields);
            std::int64_t stage = 0, vlabel = 0;
            ModelVote v;
            if(fields.size() != 4 || !parseInt64(fields[0], stage) || !parseInt64(fields[2], vlabel) ||
               !parseDouble(fields[3], v.confidence)) return false;
            v.stage = static_cast<int>(stage);
            v.model = fields[1];
            v.label = static_cast<int>(vlabel);
            r.breakdown.push_back(v);
        }
    }
    if(!tok[9].empty()){
        splitOn(tok[9], '|', entries);
        for(const auto& e : entries){
            double v = 0.0;
            if(!parseDouble(e, v)) return false;
            r.votingScores.push_back(v);
        }
    }
    return true;
}

bool CsvClassificationLog::append(const ClassificationRecord& record){
    const std::string line = encode(record);
    std::lock_guard<std::mutex> lock(mu);
    std::ofstream out(file, std::ios::app);
    if(!out) return false;
    out << line << '\n';
    out.flush();
    return static_cast<bool>(out);
}

std::vector<ClassificationRecord> CsvClassificationLog::query(const LogQuery& q) const{
    std::vector<ClassificationRecord> records;
    {
        std::lock_guard<std::mutex> lock(mu);
        std::ifstream in(file);
        std::string line;
        ClassificationRecord r;
        while(std::getline(in, line)){
            if(line.empty() || !decode(line, r)) continue;
            if(matches(r, q)) records.push_back(r);
        }
    }
    std::stable_sort(records.begin(), records.end(), [](const ClassificationRecord& a, const ClassificationRecord& b){
        return a.timestampMs < b.timestampMs;
    });
    return records;
}

std::size_t CsvClassificationLog::count() const{
    std::lock_guard<std::mutex> lock(mu);
    return countLocked();
}

std::size_t CsvClassificationLog::countLocked() const{
    std::ifstream in(file);
    std::size_t n = 0;
    std::string line;
    ClassificationRecord r;
    while(std::getline(in, line)){
        if(!line.empty() && decode(line, r)) ++n;
    }
    return n;
}

bool CsvClassificationLog::reset(std::size_t& deleted){
    std::lock_guard<std::mutex> lock(mu);
    deleted = countLocked();
    std::ofstream out(file, std::ios::trunc);
    if(!out){
        deleted = 0;
        return false;
    }
    return true;
}
