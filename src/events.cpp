// =============================================================================
// events.cpp - Event JSON rendering and event log
// =============================================================================

#include "cpamm/events.hpp"

#include <nlohmann/json.hpp>

namespace cpamm {

using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

const char* event_name(const Event& event) noexcept {
    switch (event.index()) {
        case 0: return "PoolCreated";
        case 1: return "LiquidityAdded";
        case 2: return "LiquidityRemoved";
        case 3: return "Swap";
    }
    return "unknown";
}

json to_json(const Event& event) {
    json j = std::visit(overloaded{
        [](const PoolCreated& e) {
            return json{
                {"pool_id", pool_id_to_hex(e.pool_id)},
                {"asset0", addresses::to_hex(e.asset0.addr)},
                {"asset1", addresses::to_hex(e.asset1.addr)}
            };
        },
        [](const LiquidityAdded& e) {
            return json{
                {"pool_id", pool_id_to_hex(e.pool_id)},
                {"provider", addresses::to_hex(e.provider)},
                {"amount0", to_string(e.amount0)},
                {"amount1", to_string(e.amount1)},
                {"shares_minted", to_string(e.shares_minted)}
            };
        },
        [](const LiquidityRemoved& e) {
            return json{
                {"pool_id", pool_id_to_hex(e.pool_id)},
                {"provider", addresses::to_hex(e.provider)},
                {"amount0", to_string(e.amount0)},
                {"amount1", to_string(e.amount1)},
                {"shares_burned", to_string(e.shares_burned)}
            };
        },
        [](const Swapped& e) {
            return json{
                {"pool_id", pool_id_to_hex(e.pool_id)},
                {"sender", addresses::to_hex(e.sender)},
                {"recipient", addresses::to_hex(e.recipient)},
                {"asset_in", addresses::to_hex(e.asset_in.addr)},
                {"amount_in", to_string(e.amount_in)},
                {"asset_out", addresses::to_hex(e.asset_out.addr)},
                {"amount_out", to_string(e.amount_out)}
            };
        }
    }, event);
    j["event"] = event_name(event);
    return j;
}

json EventLog::to_json() const {
    json arr = json::array();
    for (const auto& e : events_) {
        arr.push_back(cpamm::to_json(e));
    }
    return arr;
}

} // namespace cpamm
