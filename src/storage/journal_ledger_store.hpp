#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <string>

#include "storage/memory_ledger_store.hpp"

namespace lotledger::storage {

/// MemoryLedgerStore made durable by a write-ahead JSON-lines journal.
/// Each commit and snapshot upsert is appended and flushed before it is
/// applied in memory; opening the store replays the journal.
class JournalLedgerStore : public MemoryLedgerStore {
public:
    /// Replays an existing journal, then opens it for append.
    /// Throws StorageError if the file cannot be read, parsed or opened.
    explicit JournalLedgerStore(const std::string& path);
    ~JournalLedgerStore() override;

    JournalLedgerStore(const JournalLedgerStore&) = delete;
    JournalLedgerStore& operator=(const JournalLedgerStore&) = delete;

    void commit(const LedgerBatch& batch) override;
    valuation::DailyPnLSnapshot upsert_snapshot(
        const valuation::DailyPnLSnapshot& snapshot) override;

    const std::string& path() const { return path_; }
    size_t replayed_entries() const { return replayed_entries_; }

    static nlohmann::json batch_to_json(const LedgerBatch& batch);
    static LedgerBatch batch_from_json(const nlohmann::json& j);

private:
    void replay();
    /// Append and flush one line. On failure the partial line is cut off and
    /// StorageError thrown; later appends still work.
    void append(const nlohmann::json& entry);
    void truncate_to(std::uintmax_t offset);

    std::string path_;
    std::ofstream file_;
    size_t replayed_entries_ = 0;
};

}  // namespace lotledger::storage
