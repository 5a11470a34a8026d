#ifndef LENDCORE_EVENTS_HPP
#define LENDCORE_EVENTS_HPP

#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace lendcore {

// =============================================================================
// Domain Events
// =============================================================================

struct GuaranteeLocked {
    uint64_t id;
    Address borrower;
    Address lender;
    Currency asset;
    Amount principal;
    Amount promised_interest;
    uint64_t start_time;
    uint64_t maturity_time;
};

struct GuaranteeTerminated {
    uint64_t id;
    Address borrower;
    Address lender;
    Currency asset;
    GuaranteeStatus outcome;
    Amount paid_to_lender;
    Amount platform_fee;
    Amount refund_to_borrower;
    uint64_t timestamp;
};

struct DebtRecorded {
    Address user;
    Currency asset;
    DebtChange kind;
    Amount amount;
    Amount new_debt;
    Amount total_debt_by_asset;
};

struct CollateralRecorded {
    Address user;
    Currency asset;
    CollateralChange kind;
    Amount amount;
    Amount new_collateral;
};

// Emitted whenever a valuation took the fallback path (or was rejected)
struct DegradationTriggered {
    Currency asset;
    std::string operation;
    DegradationReason reason;
    std::string details;
    Amount fallback_value;
    bool is_valid;
};

struct OracleHealthChanged {
    Currency asset;
    bool healthy;
    std::string details;
};

struct SettlementRolledBack {
    uint64_t guarantee_id;
    int32_t status;
};

using Event = std::variant<
    GuaranteeLocked,
    GuaranteeTerminated,
    DebtRecorded,
    CollateralRecorded,
    DegradationTriggered,
    OracleHealthChanged,
    SettlementRolledBack
>;

// Stable event name ("guarantee_locked", ...)
const char* event_name(const Event& event);

void to_json(nlohmann::json& j, const Event& event);

// =============================================================================
// EventBus - synchronous in-process fan-out
// =============================================================================

class EventBus {
public:
    using Callback = std::function<void(const Event&)>;

    EventBus() = default;

    // Non-copyable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Returns a subscription id usable with unsubscribe()
    uint64_t subscribe(Callback callback);
    void unsubscribe(uint64_t id);

    void publish(const Event& event) const;

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<uint64_t, Callback>> subscribers_;
    uint64_t next_id_{1};
};

// =============================================================================
// JsonEventLog - one JSON object per line, for operator reconciliation
// =============================================================================

class JsonEventLog {
public:
    explicit JsonEventLog(std::ostream& out);

    void operator()(const Event& event);

    uint64_t lines_written() const { return lines_; }

private:
    std::ostream& out_;
    uint64_t lines_{0};
};

} // namespace lendcore

#endif // LENDCORE_EVENTS_HPP
