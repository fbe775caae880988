// =============================================================================
// store.cpp - Record persistence
// =============================================================================

#include "kswap/store.hpp"
#include "kswap/codec.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace kswap {

using json = nlohmann::json;

// =============================================================================
// Registry
// =============================================================================

int32_t RecordStore::put_registry(const Registry& registry) {
    if (registry_) return errors::REGISTRY_ALREADY_INITIALIZED;
    registry_ = registry;
    return errors::OK;
}

// =============================================================================
// Pairs
// =============================================================================

int32_t RecordStore::allocate_pair(const Pair& pair) {
    bool inserted = pairs_.emplace(pair.key, pair).second;
    return inserted ? errors::OK : errors::PAIR_EXISTS;
}

Pair* RecordStore::find_pair(const Address& key) {
    auto it = pairs_.find(key);
    return it != pairs_.end() ? &it->second : nullptr;
}

const Pair* RecordStore::find_pair(const Address& key) const {
    auto it = pairs_.find(key);
    return it != pairs_.end() ? &it->second : nullptr;
}

std::vector<Pair> RecordStore::pairs() const {
    std::vector<Pair> result;
    result.reserve(pairs_.size());
    for (const auto& [key, pair] : pairs_) result.push_back(pair);
    return result;
}

// =============================================================================
// JSON
// =============================================================================

json RecordStore::to_json() const {
    json j;
    j["registry"] = registry_ ? json(*registry_) : json(nullptr);
    j["pairs"] = pairs();
    return j;
}

RecordStore RecordStore::from_json(const json& j) {
    RecordStore store;

    const json& registry = j.at("registry");
    if (!registry.is_null()) {
        store.registry_ = registry.get<Registry>();
    }

    for (const auto& item : j.at("pairs")) {
        Pair pair = item.get<Pair>();
        if (store.allocate_pair(pair) != errors::OK) {
            throw std::runtime_error("Duplicate pair record: " + to_hex(pair.key));
        }
    }
    return store;
}

// =============================================================================
// State File
// =============================================================================

void save_state(const std::string& path, const RecordStore& store,
                const MemoryLedger& ledger) {
    json j;
    j["records"] = store.to_json();
    j["ledger"] = ledger.snapshot();

    std::ofstream file{path, std::ios::trunc};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write state file: " + path);
    }
    file << j.dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Failed writing state file: " + path);
    }
}

bool load_state(const std::string& path, RecordStore& store, MemoryLedger& ledger) {
    std::ifstream file{path};
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        json j = json::parse(buffer.str());
        RecordStore loaded = RecordStore::from_json(j.at("records"));
        MemoryLedger::Snapshot snapshot = j.at("ledger").get<MemoryLedger::Snapshot>();

        store = std::move(loaded);
        ledger.restore(snapshot);
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed state file " + path + ": " + e.what());
    }
    return true;
}

} // namespace kswap
