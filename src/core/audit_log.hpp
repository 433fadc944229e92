#ifndef REWARDLEDGER_CORE_AUDIT_LOG_HPP
#define REWARDLEDGER_CORE_AUDIT_LOG_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "util/logger.hpp"

namespace rewardledger {
namespace core {

enum class AuditKind {
    BatchEntry,
    BatchSummary,
    Claim,
    EmergencyWithdrawal
};

inline const char* AuditKindName(AuditKind kind)
{
    switch (kind) {
    case AuditKind::BatchEntry:          return "batch_entry";
    case AuditKind::BatchSummary:        return "batch_summary";
    case AuditKind::Claim:               return "claim";
    case AuditKind::EmergencyWithdrawal: return "emergency_withdrawal";
    }
    return "unknown";
}

inline AuditKind ParseAuditKind(const std::string &name)
{
    if (name == "batch_entry")          return AuditKind::BatchEntry;
    if (name == "batch_summary")        return AuditKind::BatchSummary;
    if (name == "claim")                return AuditKind::Claim;
    if (name == "emergency_withdrawal") return AuditKind::EmergencyWithdrawal;
    throw std::invalid_argument("ParseAuditKind: unknown kind '" + name + "'");
}

/**
 * @struct AuditRecord
 * @brief One externally observable settlement event.
 *
 * For BatchSummary, affiliate is empty, amount is the batch sum and
 * entryCount the number of affiliates paid. For EmergencyWithdrawal the
 * affiliate field holds the authority that received the funds.
 */
struct AuditRecord
{
    uint64_t  sequence{0};
    AuditKind kind{AuditKind::Claim};
    Address   affiliate;
    Amount    amount{0};
    Epoch     epoch{0};
    uint64_t  entryCount{0};
    uint64_t  timestamp{0};
};

/*
  AuditLog
  --------------------------------
  Append-only record of settlements, kept in memory and, when a file path is
  given, mirrored line by line into that file. On construction the file is
  replayed so sequence numbers continue across restarts. Records are never
  rewritten or removed.

  Line format (space separated, '-' for an empty affiliate):
    <sequence> <kind> <affiliate> <amount> <epoch> <entryCount> <timestamp>
*/
class AuditLog {
  public:
    explicit AuditLog(const std::string& storageFile = "")
        : m_storageFile(storageFile), m_nextSequence(1) {
        loadFromDisk();
    }

    /**
     * @brief Assign the next sequence number and append.
     * @return The stored record.
     * @throw std::runtime_error if the file mirror cannot be written.
     */
    AuditRecord Append(AuditRecord record) {
        std::lock_guard<std::mutex> lock(m_mutex);
        record.sequence = m_nextSequence;
        if (!appendToFile(record)) {
            throw std::runtime_error("AuditLog: failed to append to " + m_storageFile);
        }
        ++m_nextSequence;
        m_records.push_back(record);
        return record;
    }

    std::vector<AuditRecord> Records() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records;
    }

    std::vector<AuditRecord> RecordsForEpoch(Epoch epoch) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<AuditRecord> out;
        for (const auto& r : m_records) {
            if (r.epoch == epoch && r.kind != AuditKind::EmergencyWithdrawal) {
                out.push_back(r);
            }
        }
        return out;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records.size();
    }

    const std::string& GetStorageFile() const { return m_storageFile; }

  private:
    bool appendToFile(const AuditRecord& r) const {
        if (m_storageFile.empty())
            return true;

        std::ofstream out(m_storageFile, std::ios::app);
        if (!out.is_open())
            return false;

        out << r.sequence << ' ' << AuditKindName(r.kind) << ' '
            << (r.affiliate.empty() ? std::string("-") : r.affiliate) << ' '
            << r.amount << ' ' << r.epoch << ' ' << r.entryCount << ' ' << r.timestamp << '\n';
        out.flush();
        return static_cast<bool>(out);
    }

    void loadFromDisk() {
        m_records.clear();
        if (m_storageFile.empty())
            return;

        std::ifstream in(m_storageFile);
        if (!in.is_open())
            return;

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (line.empty())
                continue;

            std::istringstream fields(line);
            AuditRecord r;
            std::string kind;
            if (!(fields >> r.sequence >> kind >> r.affiliate >> r.amount >> r.epoch >> r.entryCount
                         >> r.timestamp)) {
                throw std::runtime_error("AuditLog: malformed line " + std::to_string(lineNo) +
                                         " in " + m_storageFile);
            }
            r.kind = ParseAuditKind(kind);
            if (r.affiliate == "-")
                r.affiliate.clear();
            m_records.push_back(r);
            if (r.sequence >= m_nextSequence)
                m_nextSequence = r.sequence + 1;
        }

        rewardledger::util::logger::info("[AuditLog] Replayed " + std::to_string(m_records.size()) +
                                         " audit records from " + m_storageFile);
    }

    mutable std::mutex m_mutex;
    std::string m_storageFile;
    uint64_t m_nextSequence;
    std::vector<AuditRecord> m_records;
};

} // namespace core
} // namespace rewardledger

#endif // REWARDLEDGER_CORE_AUDIT_LOG_HPP
