#ifndef KSWAP_EVENTS_HPP
#define KSWAP_EVENTS_HPP

#include <iosfwd>
#include <mutex>

#include "types.hpp"

namespace kswap {

// =============================================================================
// Event Records
// =============================================================================

struct PairCreatedEvent {
    Address token_a;
    Address token_b;
    Address pair;
    uint64_t pair_count;
};

// Shared by liquidity-added and liquidity-removed
struct LiquidityEvent {
    Address pair;
    Address sender;
    Amount amount_a;
    Amount amount_b;
    Amount shares;
};

struct SwapEvent {
    Address pair;
    Address sender;
    Amount amount_in;
    Amount amount_out;
    bool a_in;              // true when asset A was the input
};

// =============================================================================
// Event Sink
//
// Fire-and-forget observers. Events are delivered after the state change they
// describe has been committed; nothing depends on delivery.
// =============================================================================

class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void on_pair_created(const PairCreatedEvent& event) {}
    virtual void on_liquidity_added(const LiquidityEvent& event) {}
    virtual void on_liquidity_removed(const LiquidityEvent& event) {}
    virtual void on_swap(const SwapEvent& event) {}
};

// Null sink (no-op)
class NullEventSink : public IEventSink {};

// Writes one JSON object per event and line
class JsonEventSink : public IEventSink {
public:
    explicit JsonEventSink(std::ostream& out);

    void on_pair_created(const PairCreatedEvent& event) override;
    void on_liquidity_added(const LiquidityEvent& event) override;
    void on_liquidity_removed(const LiquidityEvent& event) override;
    void on_swap(const SwapEvent& event) override;

private:
    std::ostream& out_;
    std::mutex out_mutex_;
};

} // namespace kswap

#endif // KSWAP_EVENTS_HPP
