// lendcore - Lending Protocol Tests

#include <catch2/catch.hpp>
#include "mocks.hpp"

using namespace lendcore;
using namespace lendcore::test;

namespace {

ProtocolConfig protocol_config() {
    ProtocolConfig config;
    config.with_log_level("off")
          .with_settlement_token(USDC)
          .with_platform_fee(100, TREASURY);
    return config;
}

// ADMIN holds every claim; prices: USDC 1, WETH 2000
struct ProtocolFixture {
    ManualClock clock;
    MockPriceFeed feed{clock};
    MockAccessControl access;
    MockTransferAgent agent;
    LendingProtocol protocol{protocol_config(), Collaborators{&feed, &access, &agent}, clock};
    EventRecorder recorder{protocol.events()};

    ProtocolFixture() {
        access.grant_all(ADMIN);
        feed.set_price(USDC, WAD);
        feed.set_price(WETH, 2000 * WAD);
    }
};

} // namespace

TEST_CASE("Protocol construction", "[protocol]") {
    ManualClock clock;
    MockPriceFeed feed(clock);
    MockAccessControl access;
    MockTransferAgent agent;
    MockModuleResolver resolver;

    SECTION("Modules resolved by name") {
        resolver.add(modules::PRICE_FEED, static_cast<IPriceFeed*>(&feed));
        resolver.add(modules::ACCESS_CONTROL, static_cast<IAccessControl*>(&access));
        resolver.add(modules::TRANSFER_AGENT, static_cast<ITransferAgent*>(&agent));

        auto protocol = LendingProtocol::from_resolver(protocol_config(), resolver, clock);
        REQUIRE(protocol != nullptr);
        REQUIRE(resolver.resolves() == 3);
        REQUIRE(protocol->valuation().has_feed());
        REQUIRE(protocol->settlement().has_transfer_agent());

        access.grant_all(ADMIN);
        REQUIRE(protocol->deposit(ADMIN, ALICE, WETH, 1) == errors::OK);
    }

    SECTION("Missing modules degrade instead of failing") {
        resolver.add(modules::ACCESS_CONTROL, static_cast<IAccessControl*>(&access));
        access.grant_all(ADMIN);

        auto protocol = LendingProtocol::from_resolver(protocol_config(), resolver, clock);
        REQUIRE_FALSE(protocol->valuation().has_feed());
        REQUIRE_FALSE(protocol->settlement().has_transfer_agent());

        // Settlement token still valued at face
        REQUIRE(protocol->valuation().get_value(USDC, 10).value == 10);

        uint64_t id = 0;
        REQUIRE(protocol->lock_guarantee(ADMIN, ALICE, BOB, USDC, 1000, 50, 30, id) == errors::OK);
        clock.advance_days(10);
        auto r = protocol->process_early_repayment(ADMIN, ALICE, USDC, 2000);
        REQUIRE(r.status == errors::MODULE_UNAVAILABLE);
    }

    SECTION("A handle of the wrong kind is ignored") {
        resolver.add(modules::PRICE_FEED, static_cast<ITransferAgent*>(&agent));
        auto protocol = LendingProtocol::from_resolver(protocol_config(), resolver, clock);
        REQUIRE_FALSE(protocol->valuation().has_feed());
    }

    SECTION("Config is kept") {
        LendingProtocol protocol(protocol_config(), Collaborators{}, clock);
        REQUIRE(protocol.config().settlement.platform_fee_receiver == TREASURY);
        REQUIRE(protocol.settlement().platform_fee_rate() == 100);
    }
}

TEST_CASE("Protocol authorization", "[protocol]") {
    ProtocolFixture f;

    SECTION("Callers without the claim are refused") {
        REQUIRE(f.protocol.deposit(BOB, ALICE, WETH, 1) == errors::UNAUTHORIZED);
        REQUIRE(f.protocol.borrow(BOB, ALICE, USDC, 1) == errors::UNAUTHORIZED);
        REQUIRE(f.protocol.set_platform_fee_rate(BOB, 10) == errors::UNAUTHORIZED);
        REQUIRE(f.protocol.pause(BOB) == errors::UNAUTHORIZED);
        REQUIRE(f.protocol.process_default(BOB, ALICE, USDC).status == errors::UNAUTHORIZED);
        REQUIRE_FALSE(f.protocol.get_position(ALICE, WETH).has_value());
    }

    SECTION("Claims are per action") {
        f.access.grant(Action::DEPOSIT, BOB);
        REQUIRE(f.protocol.deposit(BOB, ALICE, WETH, 1) == errors::OK);
        REQUIRE(f.protocol.withdraw(BOB, ALICE, WETH, 1) == errors::UNAUTHORIZED);

        f.access.revoke(Action::DEPOSIT, BOB);
        REQUIRE(f.protocol.deposit(BOB, ALICE, WETH, 1) == errors::UNAUTHORIZED);
    }

    SECTION("No access control refuses everything") {
        LendingProtocol bare(protocol_config(), Collaborators{&f.feed, nullptr, &f.agent}, f.clock);
        REQUIRE(bare.deposit(ADMIN, ALICE, WETH, 1) == errors::UNAUTHORIZED);
        REQUIRE(bare.pause(ADMIN) == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Protocol pause", "[protocol]") {
    ProtocolFixture f;

    REQUIRE_FALSE(f.protocol.paused());
    REQUIRE(f.protocol.unpause(ADMIN) == errors::NOT_PAUSED);
    REQUIRE(f.protocol.pause(ADMIN) == errors::OK);
    REQUIRE(f.protocol.paused());
    REQUIRE(f.protocol.pause(ADMIN) == errors::ALREADY_PAUSED);

    SECTION("Business calls are blocked") {
        uint64_t id = 0;
        REQUIRE(f.protocol.deposit(ADMIN, ALICE, WETH, 1) == errors::PAUSED);
        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 1) == errors::PAUSED);
        REQUIRE(f.protocol.lock_guarantee(ADMIN, ALICE, BOB, USDC, 1000, 50, 30, id) == errors::PAUSED);
        REQUIRE(f.protocol.process_early_repayment(ADMIN, ALICE, USDC, 10).status == errors::PAUSED);
        REQUIRE(f.protocol.liquidate(ADMIN, ALICE, USDC, 1, WETH, 1).status == errors::PAUSED);
    }

    SECTION("Unauthorized wins over paused") {
        REQUIRE(f.protocol.deposit(BOB, ALICE, WETH, 1) == errors::UNAUTHORIZED);
    }

    SECTION("Parameters can still be changed") {
        REQUIRE(f.protocol.set_platform_fee_rate(ADMIN, 200) == errors::OK);
        REQUIRE(f.protocol.settlement().platform_fee_rate() == 200);
    }

    SECTION("Unpause restores service") {
        REQUIRE(f.protocol.unpause(ADMIN) == errors::OK);
        REQUIRE(f.protocol.deposit(ADMIN, ALICE, WETH, 1) == errors::OK);
    }
}

TEST_CASE("Protocol positions", "[protocol]") {
    ProtocolFixture f;

    // 10 WETH at 2000 = 20000 of collateral value
    REQUIRE(f.protocol.deposit(ADMIN, ALICE, WETH, 10) == errors::OK);

    SECTION("Borrow gated by the health factor") {
        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 19000) == errors::HEALTH_FACTOR_TOO_LOW);
        REQUIRE_FALSE(f.protocol.get_position(ALICE, USDC).has_value());

        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 18000) == errors::OK);
        REQUIRE(f.protocol.get_position(ALICE, USDC)->debt == 18000);
        REQUIRE(f.protocol.health_factor(ALICE) == 11111);
    }

    SECTION("Borrow input checks") {
        REQUIRE(f.protocol.borrow(ADMIN, addresses::ZERO, USDC, 1) == errors::ZERO_ADDRESS);
        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 0) == errors::ZERO_AMOUNT);
    }

    SECTION("Withdraw gated by balance and health") {
        REQUIRE(f.protocol.withdraw(ADMIN, ALICE, WETH, 11) == errors::INSUFFICIENT_COLLATERAL);

        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 10000) == errors::OK);
        REQUIRE(f.protocol.withdraw(ADMIN, ALICE, WETH, 5) == errors::HEALTH_FACTOR_TOO_LOW);
        REQUIRE(f.protocol.withdraw(ADMIN, ALICE, WETH, 4) == errors::OK);
        REQUIRE(f.protocol.get_position(ALICE, WETH)->collateral == 6);
    }

    SECTION("Repay") {
        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 1000) == errors::OK);
        REQUIRE(f.protocol.repay(ADMIN, ALICE, USDC, 1001) == errors::OVERPAY);
        REQUIRE(f.protocol.repay(ADMIN, ALICE, USDC, 1000) == errors::OK);
        REQUIRE(f.protocol.health_factor(ALICE) == HEALTH_FACTOR_MAX);
    }

    SECTION("Health report") {
        REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 10000) == errors::OK);
        auto report = f.protocol.user_health(ALICE);
        REQUIRE(report.collateral_value == 20000);
        REQUIRE(report.debt_value == 10000);
        REQUIRE(report.health_factor_bps == 20000);
    }
}

TEST_CASE("Protocol liquidation", "[protocol]") {
    ProtocolFixture f;
    REQUIRE(f.protocol.deposit(ADMIN, ALICE, WETH, 10) == errors::OK);
    REQUIRE(f.protocol.borrow(ADMIN, ALICE, USDC, 18000) == errors::OK);

    SECTION("Healthy positions cannot be liquidated") {
        auto r = f.protocol.liquidate(ADMIN, ALICE, USDC, 9000, WETH, 5);
        REQUIRE(r.status == errors::NOT_LIQUIDATABLE);
        REQUIRE(r.health_factor_bps == 11111);
        REQUIRE(f.protocol.get_position(ALICE, USDC)->debt == 18000);
    }

    SECTION("Liquidation after a price drop") {
        f.feed.set_price(WETH, 1800 * WAD);

        auto r = f.protocol.liquidate(ADMIN, ALICE, USDC, 9000, WETH, 5);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.health_factor_bps == 10000);
        REQUIRE(r.debt_reduced == 9000);
        REQUIRE(r.collateral_seized == 5);
        REQUIRE(f.protocol.get_position(ALICE, USDC)->debt == 9000);
        REQUIRE(f.protocol.get_position(ALICE, WETH)->collateral == 5);
        REQUIRE(f.protocol.ledger().total_debt_by_asset(USDC) == 9000);
    }

    SECTION("Requests larger than the position are clamped") {
        f.feed.set_price(WETH, 1800 * WAD);

        auto r = f.protocol.liquidate(ADMIN, ALICE, USDC, 50000, WETH, 50);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.debt_reduced == 18000);
        REQUIRE(r.collateral_seized == 10);
        REQUIRE_FALSE(f.protocol.get_position(ALICE, USDC).has_value());
    }

    SECTION("Unvalued debt is reported, not treated as healthy") {
        REQUIRE(f.protocol.ledger().record_borrow(ALICE, WBTC, 1) == errors::OK);
        f.feed.set_price(WETH, 1000 * WAD);

        auto r = f.protocol.liquidate(ADMIN, ALICE, USDC, 9000, WETH, 5);
        REQUIRE(r.status == errors::VALUATION_UNAVAILABLE);
        REQUIRE(r.debt_reduced == 0);
        REQUIRE(f.protocol.get_position(ALICE, USDC)->debt == 18000);
        REQUIRE(f.protocol.get_position(ALICE, WETH)->collateral == 10);
    }

    SECTION("Input checks") {
        REQUIRE(f.protocol.liquidate(ADMIN, ALICE, USDC, 0, WETH, 1).status == errors::ZERO_AMOUNT);
        REQUIRE(f.protocol.liquidate(ADMIN, ALICE, Currency{}, 1, WETH, 1).status == errors::ZERO_ADDRESS);
        REQUIRE(f.protocol.liquidate(BOB, ALICE, USDC, 1, WETH, 1).status == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Protocol guarantee lifecycle", "[protocol]") {
    ProtocolFixture f;

    uint64_t id = 0;
    REQUIRE(f.protocol.lock_guarantee(ADMIN, ALICE, BOB, USDC, 1000000, 50000, 100, id) == errors::OK);
    REQUIRE(f.protocol.get_guarantee(id)->is_active());

    f.clock.advance_days(40);
    auto preview = f.protocol.preview_early_repayment(id, 1021500);
    REQUIRE(preview.status == errors::OK);

    auto r = f.protocol.process_early_repayment(ADMIN, ALICE, USDC, 1021500);
    REQUIRE(r.status == errors::OK);
    REQUIRE(r.paid_to_lender == preview.paid_to_lender);
    REQUIRE(f.protocol.get_guarantee(id)->status == GuaranteeStatus::EARLY_REPAID);
    REQUIRE(f.agent.total_to(TREASURY) == 15);

    REQUIRE(f.recorder.of<GuaranteeLocked>().size() == 1);
    REQUIRE(f.recorder.of<GuaranteeTerminated>().size() == 1);

    SECTION("Matured and default paths go through the same gate") {
        uint64_t second = 0;
        REQUIRE(f.protocol.lock_guarantee(ADMIN, ALICE, BOB, USDC, 1000, 50, 10, second) == errors::OK);
        REQUIRE(f.protocol.process_matured_repayment(ADMIN, ALICE, USDC, 2000).status == errors::NOT_MATURED);

        f.clock.advance_days(11);
        REQUIRE(f.protocol.process_default(ADMIN, ALICE, USDC).status == errors::OK);
        REQUIRE(f.protocol.get_guarantee(second)->status == GuaranteeStatus::DEFAULTED);
    }

    SECTION("Penalty days are governed") {
        REQUIRE(f.protocol.set_early_repay_penalty_days(BOB, 5) == errors::UNAUTHORIZED);
        REQUIRE(f.protocol.set_early_repay_penalty_days(ADMIN, 5) == errors::OK);
        REQUIRE(f.protocol.guarantees().early_repay_penalty_days() == 5);
        REQUIRE(f.protocol.set_platform_fee_receiver(ADMIN, addresses::ZERO) == errors::ZERO_ADDRESS);
    }
}

TEST_CASE("Protocol oracle health", "[protocol]") {
    ProtocolFixture f;

    REQUIRE(f.protocol.check_price_oracle_health(WETH).is_healthy);
    REQUIRE(f.protocol.publish_oracle_health(WETH));

    f.feed.set_quote(WETH, PriceQuote{2000 * WAD, f.clock.now() - 7200, 18, true});
    REQUIRE(f.protocol.check_price_oracle_health(WETH).details == "Price stale");
    REQUIRE_FALSE(f.protocol.publish_oracle_health(WETH));

    auto changes = f.recorder.of<OracleHealthChanged>();
    REQUIRE(changes.size() == 2);
    REQUIRE_FALSE(changes[1].healthy);
}
