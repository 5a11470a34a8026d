// =============================================================================
// events.cpp - Event fan-out and JSON rendering
// =============================================================================

#include "lendcore/events.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace lendcore {

namespace {

using nlohmann::json;

// Overload set for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string hex(const Address& a) { return addresses::to_hex(a); }
std::string hex(const Currency& c) { return addresses::to_hex(c.addr); }

} // namespace

const char* event_name(const Event& event) {
    return std::visit(overloaded{
        [](const GuaranteeLocked&) { return "guarantee_locked"; },
        [](const GuaranteeTerminated&) { return "guarantee_terminated"; },
        [](const DebtRecorded&) { return "debt_recorded"; },
        [](const CollateralRecorded&) { return "collateral_recorded"; },
        [](const DegradationTriggered&) { return "degradation_triggered"; },
        [](const OracleHealthChanged&) { return "oracle_health_changed"; },
        [](const SettlementRolledBack&) { return "settlement_rolled_back"; },
    }, event);
}

// 128-bit amounts are rendered as decimal strings so no JSON reader truncates them
void to_json(nlohmann::json& j, const Event& event) {
    j = json::object();
    j["event"] = event_name(event);

    std::visit(overloaded{
        [&](const GuaranteeLocked& e) {
            j["id"] = e.id;
            j["borrower"] = hex(e.borrower);
            j["lender"] = hex(e.lender);
            j["asset"] = hex(e.asset);
            j["principal"] = to_string(e.principal);
            j["promised_interest"] = to_string(e.promised_interest);
            j["start_time"] = e.start_time;
            j["maturity_time"] = e.maturity_time;
        },
        [&](const GuaranteeTerminated& e) {
            j["id"] = e.id;
            j["borrower"] = hex(e.borrower);
            j["lender"] = hex(e.lender);
            j["asset"] = hex(e.asset);
            j["outcome"] = to_string(e.outcome);
            j["paid_to_lender"] = to_string(e.paid_to_lender);
            j["platform_fee"] = to_string(e.platform_fee);
            j["refund_to_borrower"] = to_string(e.refund_to_borrower);
            j["timestamp"] = e.timestamp;
        },
        [&](const DebtRecorded& e) {
            j["user"] = hex(e.user);
            j["asset"] = hex(e.asset);
            j["kind"] = to_string(e.kind);
            j["amount"] = to_string(e.amount);
            j["new_debt"] = to_string(e.new_debt);
            j["total_debt_by_asset"] = to_string(e.total_debt_by_asset);
        },
        [&](const CollateralRecorded& e) {
            j["user"] = hex(e.user);
            j["asset"] = hex(e.asset);
            j["kind"] = to_string(e.kind);
            j["amount"] = to_string(e.amount);
            j["new_collateral"] = to_string(e.new_collateral);
        },
        [&](const DegradationTriggered& e) {
            j["asset"] = hex(e.asset);
            j["operation"] = e.operation;
            j["reason"] = to_string(e.reason);
            j["details"] = e.details;
            j["fallback_value"] = to_string(e.fallback_value);
            j["is_valid"] = e.is_valid;
        },
        [&](const OracleHealthChanged& e) {
            j["asset"] = hex(e.asset);
            j["healthy"] = e.healthy;
            j["details"] = e.details;
        },
        [&](const SettlementRolledBack& e) {
            j["id"] = e.guarantee_id;
            j["status"] = e.status;
            j["error"] = errors::message(e.status);
        },
    }, event);
}

// =============================================================================
// EventBus
// =============================================================================

uint64_t EventBus::subscribe(Callback callback) {
    std::lock_guard lock(mutex_);
    uint64_t id = next_id_++;
    subscribers_.emplace_back(id, std::move(callback));
    return id;
}

void EventBus::unsubscribe(uint64_t id) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        subscribers_.end());
}

void EventBus::publish(const Event& event) const {
    // Snapshot so a subscriber may publish or subscribe without deadlocking
    std::vector<std::pair<uint64_t, Callback>> subscribers;
    {
        std::lock_guard lock(mutex_);
        subscribers = subscribers_;
    }
    for (const auto& [id, callback] : subscribers) {
        if (callback) callback(event);
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
}

// =============================================================================
// JsonEventLog
// =============================================================================

JsonEventLog::JsonEventLog(std::ostream& out) : out_(out) {}

void JsonEventLog::operator()(const Event& event) {
    nlohmann::json j;
    to_json(j, event);
    out_ << j.dump() << '\n';
    ++lines_;
}

} // namespace lendcore
