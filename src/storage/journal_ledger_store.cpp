#include "storage/journal_ledger_store.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "core/errors.hpp"

namespace lotledger::storage {

using json = nlohmann::json;

JournalLedgerStore::JournalLedgerStore(const std::string& path) : path_(path) {
    replay();

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw core::StorageError("Cannot open journal for append: " + path_);
    }
    spdlog::info("[STORE] Journal {} open, {} entries replayed", path_, replayed_entries_);
}

JournalLedgerStore::~JournalLedgerStore() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void JournalLedgerStore::commit(const LedgerBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto prepared = prepare(batch);
    append({{"type", "batch"}, {"batch", batch_to_json(prepared)}});
    apply(prepared);
}

valuation::DailyPnLSnapshot JournalLedgerStore::upsert_snapshot(
    const valuation::DailyPnLSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = prepare_snapshot(snapshot);
    append({{"type", "snapshot"}, {"snapshot", stored.to_json()}});
    apply_snapshot(stored);
    return stored;
}

void JournalLedgerStore::append(const json& entry) {
    // Every earlier entry was flushed, so the file size is where this one starts.
    std::error_code ec;
    auto offset = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw core::StorageError("Cannot stat journal " + path_ + ": " + ec.message());
    }

    file_ << entry.dump() << '\n';
    file_.flush();
    if (file_) return;

    spdlog::error("[STORE] Journal write failed: {}, truncating to {} bytes", path_, offset);
    truncate_to(offset);
    throw core::StorageError("Journal write failed: " + path_);
}

void JournalLedgerStore::truncate_to(std::uintmax_t offset) {
    // Closing drops whatever is left in the stream buffer before the cut.
    file_.close();
    file_.clear();

    std::error_code ec;
    std::filesystem::resize_file(path_, offset, ec);
    if (ec) {
        spdlog::critical("[STORE] Cannot truncate journal {}: {}", path_, ec.message());
    }

    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        spdlog::critical("[STORE] Cannot reopen journal {}", path_);
    }
}

void JournalLedgerStore::replay() {
    if (!std::filesystem::exists(path_)) return;

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw core::StorageError("Cannot read journal: " + path_);
    }

    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        if (!line.empty()) lines.push_back(std::move(line));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool torn = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        try {
            auto entry = json::parse(lines[i]);
            auto type = entry.at("type").get<std::string>();
            if (type == "batch") {
                apply(prepare(batch_from_json(entry.at("batch"))));
            } else if (type == "snapshot") {
                apply_snapshot(valuation::DailyPnLSnapshot::from_json(entry.at("snapshot")));
            } else {
                throw core::StorageError("unknown entry type '" + type + "'");
            }
            ++replayed_entries_;
        } catch (const std::exception& e) {
            // A torn final line is what a crash mid-append leaves behind.
            if (i + 1 == lines.size() && dynamic_cast<const json::parse_error*>(&e)) {
                spdlog::warn("[STORE] Dropping torn last journal line {}: {}", i + 1, e.what());
                torn = true;
                break;
            }
            throw core::StorageError("Corrupt journal " + path_ + " at line " +
                                     std::to_string(i + 1) + ": " + e.what());
        }
    }

    if (torn) {
        in.close();
        std::ofstream rewrite(path_, std::ios::out | std::ios::trunc);
        for (size_t i = 0; i + 1 < lines.size(); ++i) rewrite << lines[i] << '\n';
        if (!rewrite) {
            throw core::StorageError("Cannot truncate torn journal: " + path_);
        }
    }
}

json JournalLedgerStore::batch_to_json(const LedgerBatch& batch) {
    json j;
    j["transaction"] = batch.transaction.to_json();
    j["opened_lot"] = batch.opened_lot ? batch.opened_lot->to_json() : json(nullptr);

    j["updated_lots"] = json::array();
    for (const auto& lot : batch.updated_lots) j["updated_lots"].push_back(lot.to_json());

    j["allocations"] = json::array();
    for (const auto& alloc : batch.allocations) j["allocations"].push_back(alloc.to_json());

    j["position"] = batch.position.to_json();
    return j;
}

LedgerBatch JournalLedgerStore::batch_from_json(const json& j) {
    LedgerBatch batch;
    batch.transaction = booking::Transaction::from_json(j.at("transaction"));
    if (j.contains("opened_lot") && !j["opened_lot"].is_null()) {
        batch.opened_lot = booking::PositionLot::from_json(j["opened_lot"]);
    }
    for (const auto& lot : j.at("updated_lots")) {
        batch.updated_lots.push_back(booking::PositionLot::from_json(lot));
    }
    for (const auto& alloc : j.at("allocations")) {
        batch.allocations.push_back(booking::SaleAllocation::from_json(alloc));
    }
    batch.position = booking::Position::from_json(j.at("position"));
    return batch;
}

}  // namespace lotledger::storage
