#ifndef KSWAP_STORE_HPP
#define KSWAP_STORE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "registry.hpp"
#include "pair.hpp"
#include "ledger.hpp"

namespace kswap {

// =============================================================================
// RecordStore - Registry singleton and pair records by deterministic key
//
// Not synchronized; Exchange serializes access.
// =============================================================================

class RecordStore {
public:
    RecordStore() = default;

    // =========================================================================
    // Registry
    // =========================================================================

    bool has_registry() const { return registry_.has_value(); }

    // REGISTRY_ALREADY_INITIALIZED if one is stored already
    int32_t put_registry(const Registry& registry);

    Registry* registry() { return registry_ ? &*registry_ : nullptr; }
    const Registry* registry() const { return registry_ ? &*registry_ : nullptr; }

    // =========================================================================
    // Pairs
    // =========================================================================

    // PAIR_EXISTS if a record already lives at pair.key
    int32_t allocate_pair(const Pair& pair);

    Pair* find_pair(const Address& key);
    const Pair* find_pair(const Address& key) const;

    std::vector<Pair> pairs() const;
    size_t size() const { return pairs_.size(); }

    // =========================================================================
    // JSON
    // =========================================================================

    nlohmann::json to_json() const;
    static RecordStore from_json(const nlohmann::json& j);

private:
    std::optional<Registry> registry_;
    std::map<Address, Pair> pairs_;
};

// =============================================================================
// State File (records + ledger)
// =============================================================================

// Throws std::runtime_error when the file cannot be written
void save_state(const std::string& path, const RecordStore& store,
                const MemoryLedger& ledger);

// Returns false when the file does not exist. Throws std::runtime_error on
// unreadable or malformed content.
bool load_state(const std::string& path, RecordStore& store, MemoryLedger& ledger);

} // namespace kswap

#endif // KSWAP_STORE_HPP
