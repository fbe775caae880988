// =============================================================================
// events.cpp - JSON line event sink
// =============================================================================

#include "kswap/events.hpp"
#include "kswap/codec.hpp"

#include <nlohmann/json.hpp>
#include <ostream>

namespace kswap {

using json = nlohmann::json;

JsonEventSink::JsonEventSink(std::ostream& out) : out_(out) {}

void JsonEventSink::on_pair_created(const PairCreatedEvent& event) {
    json j = event;
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << j.dump() << '\n';
}

void JsonEventSink::on_liquidity_added(const LiquidityEvent& event) {
    json j = event;
    j["type"] = "liquidity_added";
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << j.dump() << '\n';
}

void JsonEventSink::on_liquidity_removed(const LiquidityEvent& event) {
    json j = event;
    j["type"] = "liquidity_removed";
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << j.dump() << '\n';
}

void JsonEventSink::on_swap(const SwapEvent& event) {
    json j = event;
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << j.dump() << '\n';
}

} // namespace kswap
