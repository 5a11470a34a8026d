#ifndef LENDCORE_MODULES_HPP
#define LENDCORE_MODULES_HPP

#include <string>
#include <variant>

#include "types.hpp"

namespace lendcore {

class IPriceFeed;
class ITransferAgent;

// =============================================================================
// Authorization
// =============================================================================

enum class Action : uint8_t {
    LOCK_GUARANTEE = 0,
    SETTLE = 1,
    BORROW = 2,
    REPAY = 3,
    LIQUIDATE = 4,
    DEPOSIT = 5,
    WITHDRAW = 6,
    SET_PARAMETER = 7,
    PAUSE = 8
};

const char* to_string(Action action);

class IAccessControl {
public:
    virtual ~IAccessControl() = default;

    virtual bool has_claim(Action action, const Address& caller) const = 0;
};

// =============================================================================
// Module Resolution (construction time only)
// =============================================================================

namespace modules {
constexpr const char* PRICE_FEED = "PRICE_FEED";
constexpr const char* ACCESS_CONTROL = "ACCESS_CONTROL";
constexpr const char* TRANSFER_AGENT = "TRANSFER_AGENT";
} // namespace modules

// monostate when the module is not registered
using ModuleHandle = std::variant<std::monostate, IPriceFeed*, IAccessControl*, ITransferAgent*>;

class IModuleResolver {
public:
    virtual ~IModuleResolver() = default;

    virtual ModuleHandle resolve(const std::string& name) = 0;
};

} // namespace lendcore

#endif // LENDCORE_MODULES_HPP
