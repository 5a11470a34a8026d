#ifndef LENDCORE_LENDCORE_HPP
#define LENDCORE_LENDCORE_HPP

// =============================================================================
// lendcore - Collateralized lending ledger
//
// Components, leaves first:
//   ValuationService  validated values with graceful degradation
//   Ledger            per-user, per-asset debt and collateral
//   RiskEngine        health factor and liquidation eligibility
//   GuaranteeStore    fixed-term borrower/lender obligations
//   GuaranteeFund     locked guarantee deposits
//   SettlementEngine  early, matured and defaulted settlement
//   LendingProtocol   front door with authorization and pause
//
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "log.hpp"
#include "events.hpp"
#include "config.hpp"
#include "modules.hpp"
#include "valuation.hpp"
#include "ledger.hpp"
#include "risk.hpp"
#include "guarantee.hpp"
#include "guarantee_fund.hpp"
#include "settlement.hpp"
#include "protocol.hpp"

#endif // LENDCORE_LENDCORE_HPP
