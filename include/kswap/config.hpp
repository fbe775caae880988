#ifndef KSWAP_CONFIG_HPP
#define KSWAP_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace kswap {

// =============================================================================
// Exchange Configuration
// =============================================================================

struct ExchangeConfig {
    std::string state_path = "kswap-state.json";  // CLI snapshot file
    std::string log_level = "info";               // "error", "info" or "debug"
    bool emit_events = true;                      // JSON event lines on stdout
    uint8_t share_decimals = SHARE_DECIMALS;

    // Throws std::runtime_error if the file cannot be opened or parsed
    static ExchangeConfig from_file(std::string_view path);

    // Missing keys keep their defaults, unknown keys are ignored
    static ExchangeConfig from_json_string(std::string_view content);
};

} // namespace kswap

#endif // KSWAP_CONFIG_HPP
