#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "ClassificationResult.hpp"

enum class RecordKind { Prediction, Connect, Disconnect };

struct ClassificationRecord {
    RecordKind kind{RecordKind::Prediction};
    std::int64_t timestampMs{0};
    std::string clientId;
    std::string deviceId;
    int label{0};
    double confidence{0.0};
    ClassificationMethod method{ClassificationMethod::RuleBased};
    double processingMs{0.0};
    std::vector<ModelVote> breakdown;
    std::vector<double> votingScores;
};

ClassificationRecord predictionRecord(const std::string& clientId, const std::string& deviceId,
                                      std::int64_t timestampMs, const ClassificationResult& result);
ClassificationRecord connectionRecord(RecordKind kind, const std::string& clientId, std::int64_t timestampMs);

struct LogQuery {
    std::string startDate;   // inclusive YYYY-MM-DD, empty for unbounded
    std::string endDate;     // inclusive YYYY-MM-DD, empty for unbounded
    std::string deviceId;    // empty for every device; compared after the same sanitizing as stored ids
    bool predictionsOnly = true;
};

// Append-mostly store of classification history. Appends are atomic per
// record; query() returns matching records ordered by timestamp.
class ClassificationLog {
public:
    virtual ~ClassificationLog() = default;
    virtual bool append(const ClassificationRecord& record) = 0;
    virtual std::vector<ClassificationRecord> query(const LogQuery& q) const = 0;
    virtual std::size_t count() const = 0;
    // Deletes every record; deleted receives the number removed.
    virtual bool reset(std::size_t& deleted) = 0;
};

class CsvClassificationLog : public ClassificationLog {
public:
    explicit CsvClassificationLog(std::string path);

    bool append(const ClassificationRecord& record) override;
    std::vector<ClassificationRecord> query(const LogQuery& q) const override;
    std::size_t count() const override;
    bool reset(std::size_t& deleted) override;

    const std::string& path() const { return file; }

    static std::string encode(const ClassificationRecord& record);
    static bool decode(const std::string& line, ClassificationRecord& record);

private:
    // Caller holds mu.
    std::size_t countLocked() const;

    std::string file;
    mutable std::mutex mu;
};
