// QX Analytics - Valuation Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/valuation.hpp>

using namespace qx::analytics;
using namespace qx::analytics::valuation;
using Catch::Approx;

TEST_CASE("Discounted cash flow", "[valuation]") {
    DcfParams params;
    params.free_cash_flows = {100, 100, 100};
    params.discount_rate = 0.1;

    SECTION("Zero terminal growth values a flat perpetuity") {
        REQUIRE(dcf_value(params) == Approx(1000.0));
    }

    SECTION("Terminal growth adds value") {
        double flat = dcf_value(params);
        params.terminal_growth_rate = 0.02;
        REQUIRE(dcf_value(params) > flat);
    }

    SECTION("Exit multiple replaces the Gordon terminal value") {
        params.terminal_multiple = 10.0;
        params.terminal_year_fcf = 100.0;
        // PV of forecasts plus 1000 discounted three years
        double forecasts = 100 / 1.1 + 100 / 1.21 + 100 / 1.331;
        REQUIRE(dcf_value(params) == Approx(forecasts + 1000 / 1.331));
    }

    SECTION("Multiple without a terminal FCF falls back to growth") {
        params.terminal_multiple = 25.0;
        REQUIRE(dcf_value(params) == Approx(1000.0));
    }

    SECTION("Growth at or above the discount rate is undefined") {
        params.terminal_growth_rate = 0.1;
        REQUIRE_THROWS_AS(dcf_value(params), UndefinedError);
    }

    SECTION("Discount rate outside (0, 1) is rejected") {
        params.discount_rate = 1.5;
        REQUIRE_THROWS_AS(dcf_value(params), InvalidInputError);
        params.discount_rate = 0.0;
        REQUIRE_THROWS_AS(dcf_value(params), InvalidInputError);
    }

    SECTION("No forecasts") {
        params.free_cash_flows.clear();
        REQUIRE_THROWS_AS(dcf_value(params), InvalidInputError);
    }
}

TEST_CASE("Enterprise and equity value", "[valuation]") {
    SECTION("Bridges") {
        REQUIRE(enterprise_value(1000, 300, 100) == Approx(1200.0));
        REQUIRE(equity_value(1200, 300, 100) == Approx(1000.0));
        REQUIRE(equity_value(1200, 300, 100, 50) == Approx(950.0));
        REQUIRE(value_per_share(1000, 50) == Approx(20.0));
        REQUIRE_THROWS_AS(value_per_share(1000, 0), UndefinedError);
    }

    SECTION("WACC") {
        REQUIRE(wacc(600, 400, 0.1, 0.05, 0.3) == Approx(0.074));
        REQUIRE_THROWS_AS(wacc(0, 0, 0.1, 0.05, 0.3), UndefinedError);
    }

    SECTION("Gordon growth") {
        REQUIRE(gordon_growth_value(5, 0.03, 0.08) == Approx(100.0));
        REQUIRE_THROWS_AS(gordon_growth_value(5, 0.08, 0.08), UndefinedError);
    }
}

TEST_CASE("Dividend discount models", "[valuation]") {
    SECTION("Zero and constant growth") {
        REQUIRE(zero_growth_ddm(2, 0.1) == Approx(20.0));
        REQUIRE(constant_growth_ddm(2, 0.05, 0.1) == Approx(42.0));
        REQUIRE_THROWS_AS(constant_growth_ddm(2, 0.12, 0.1), UndefinedError);
        REQUIRE_THROWS_AS(constant_growth_ddm(0, 0.05, 0.1), InvalidInputError);
    }

    SECTION("Two stages collapse to constant growth when rates match") {
        REQUIRE(two_stage_ddm(2, 0.05, 5, 0.05, 0.1) == Approx(42.0));
    }

    SECTION("Higher early growth raises the two-stage value") {
        REQUIRE(two_stage_ddm(2, 0.08, 5, 0.05, 0.1) > 42.0);
        REQUIRE_THROWS_AS(two_stage_ddm(2, 0.08, 0, 0.05, 0.1), InvalidInputError);
    }

    SECTION("Three stages collapse to constant growth when rates match") {
        REQUIRE(three_stage_ddm(2, 0.05, 3, 4, 0.05, 0.1) == Approx(42.0));
    }

    SECTION("Transition sits between two-stage bounds") {
        double fast = two_stage_ddm(2, 0.08, 5, 0.04, 0.1);
        double slow = two_stage_ddm(2, 0.08, 3, 0.04, 0.1);
        double three = three_stage_ddm(2, 0.08, 3, 2, 0.04, 0.1);
        REQUIRE(three > slow);
        REQUIRE(three < fast);
    }

    SECTION("Yield and payout") {
        REQUIRE(dividend_yield(2, 50) == Approx(0.04));
        REQUIRE(payout_ratio(2, 5) == Approx(0.4));
        REQUIRE_THROWS_AS(payout_ratio(2, -1), UndefinedError);
    }
}

TEST_CASE("Relative valuation", "[valuation]") {
    SECTION("Price multiples") {
        REQUIRE(pe_ratio(50, 5) == Approx(10.0));
        REQUIRE(pb_ratio(50, 25) == Approx(2.0));
        REQUIRE(ps_ratio(50, 100) == Approx(0.5));
        REQUIRE_THROWS_AS(pe_ratio(50, 0), UndefinedError);
        REQUIRE_THROWS_AS(pb_ratio(50, -2), UndefinedError);
    }

    SECTION("Values from industry multiples") {
        REQUIRE(value_by_pe(5, 12) == Approx(60.0));
        REQUIRE(value_by_pb(25, 1.5) == Approx(37.5));
        REQUIRE(value_by_ps(100, 0.8) == Approx(80.0));
        REQUIRE_THROWS_AS(value_by_pe(5, 0), InvalidInputError);
    }

    SECTION("EV/EBITDA") {
        REQUIRE(ev_to_ebitda(1200, 150) == Approx(8.0));
        REQUIRE(value_by_ev_ebitda(100, 8, 200, 50, 10) == Approx(65.0));
        REQUIRE_THROWS_AS(ev_to_ebitda(1200, 0), UndefinedError);
        REQUIRE_THROWS_AS(value_by_ev_ebitda(100, -1, 200, 50, 10), InvalidInputError);
    }

    SECTION("PEG uses growth in percent") {
        REQUIRE(peg_ratio(20, 0.1) == Approx(2.0));
        REQUIRE_THROWS_AS(peg_ratio(20, 0.0), UndefinedError);
    }
}
