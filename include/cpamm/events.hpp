#ifndef CPAMM_EVENTS_HPP
#define CPAMM_EVENTS_HPP

#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Events
// =============================================================================

struct PoolCreated {
    PoolId pool_id;
    Asset asset0;
    Asset asset1;
};

struct LiquidityAdded {
    PoolId pool_id;
    Address provider;
    U128 amount0;
    U128 amount1;
    U128 shares_minted;
};

struct LiquidityRemoved {
    PoolId pool_id;
    Address provider;
    U128 amount0;
    U128 amount1;
    U128 shares_burned;
};

struct Swapped {
    PoolId pool_id;
    Address sender;
    Address recipient;
    Asset asset_in;
    U128 amount_in;
    Asset asset_out;
    U128 amount_out;
};

using Event = std::variant<PoolCreated, LiquidityAdded, LiquidityRemoved, Swapped>;

// "PoolCreated", "LiquidityAdded", "LiquidityRemoved" or "Swap"
const char* event_name(const Event& event) noexcept;

// {"event": name, ...}; amounts as decimal strings, addresses as 0x hex
nlohmann::json to_json(const Event& event);

// =============================================================================
// Notification Sink Interface
// =============================================================================

// Receives committed operations. Purely observational: nothing in the core
// depends on delivery.
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void notify(const Event& event) = 0;
};

// Discards everything
class NullSink : public INotificationSink {
public:
    void notify(const Event&) override {}
};

// Records events in emission order
class EventLog : public INotificationSink {
public:
    void notify(const Event& event) override { events_.push_back(event); }

    [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
    [[nodiscard]] size_t size() const noexcept { return events_.size(); }
    void clear() { events_.clear(); }

    // Events of one kind, in order
    template <typename T>
    std::vector<T> of_type() const {
        std::vector<T> out;
        for (const auto& e : events_) {
            if (const T* p = std::get_if<T>(&e)) out.push_back(*p);
        }
        return out;
    }

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::vector<Event> events_;
};

} // namespace cpamm

#endif // CPAMM_EVENTS_HPP
