// QX Analytics - JSON Serialization Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <qx/analytics/json.hpp>

using namespace qx::analytics;
using Catch::Approx;
using nlohmann::json;

TEST_CASE("Core type serialization", "[json]") {
    SECTION("Option type and exercise style") {
        REQUIRE(json(OptionType::Put) == "put");
        REQUIRE(json("call").get<OptionType>() == OptionType::Call);
        REQUIRE(json("european").get<ExerciseStyle>() == ExerciseStyle::European);
        REQUIRE_THROWS_AS(json("straddle").get<OptionType>(), InvalidInputError);
        REQUIRE_THROWS_AS(json("bermudan").get<ExerciseStyle>(), InvalidInputError);
    }

    SECTION("Solver result") {
        json j = SolverResult{0.25, true, 18};
        REQUIRE(j["value"] == 0.25);
        REQUIRE(j["converged"] == true);
        REQUIRE(j["iterations"] == 18);
    }
}

TEST_CASE("Settings serialization", "[json]") {
    SECTION("Implied volatility settings use camelCase keys") {
        options::ImpliedVolSettings s;
        s.max_iterations = 40;
        json j = s;
        REQUIRE(j.contains("maxIterations"));
        REQUIRE(j["maxIterations"] == 40);

        auto back = j.get<options::ImpliedVolSettings>();
        REQUIRE(back.max_iterations == 40);
        REQUIRE(back.upper == Approx(5.0));
    }

    SECTION("Partial objects keep defaults") {
        auto s = json::parse(R"({"tolerance": 1e-9})").get<bonds::YieldSolverSettings>();
        REQUIRE(s.tolerance == Approx(1e-9));
        REQUIRE(s.max_iterations == 100);

        auto o = json::parse(R"({"iterations": 50})").get<portfolio::OptimizerSettings>();
        REQUIRE(o.iterations == 50);
        REQUIRE(o.step == Approx(0.01));
    }
}

TEST_CASE("Portfolio serialization", "[json]") {
    SECTION("Constraints round trip") {
        auto c = portfolio::WeightConstraints{}.with_long_only().with_max_weight(0.4)
                     .with_min({0.0, 0.1, 0.0});
        json j = c;
        REQUIRE(j["longOnly"] == true);
        REQUIRE(j["maxWeight"] == 0.4);
        REQUIRE_FALSE(j.contains("minWeight"));
        REQUIRE_FALSE(j.contains("max"));

        auto back = j.get<portfolio::WeightConstraints>();
        REQUIRE(back.long_only);
        REQUIRE(back.max_weight == 0.4);
        REQUIRE_FALSE(back.min_weight.has_value());
        REQUIRE(back.min == c.min);
    }

    SECTION("Null optionals read as absent") {
        auto c = json::parse(R"({"minWeight": null})").get<portfolio::WeightConstraints>();
        REQUIRE_FALSE(c.min_weight.has_value());
        REQUIRE_FALSE(c.long_only);
    }

    SECTION("Result omits Sharpe unless computed") {
        portfolio::PortfolioResult r;
        r.weights = {0.6, 0.4};
        r.expected_return = 0.1;
        json j = r;
        REQUIRE(j["expectedReturn"] == 0.1);
        REQUIRE_FALSE(j.contains("sharpeRatio"));

        r.sharpe_ratio = 1.25;
        j = r;
        REQUIRE(j["sharpeRatio"] == 1.25);
    }

    SECTION("Markowitz parameters") {
        auto p = json::parse(R"({
            "returns": [0.08, 0.12],
            "covariance": [[0.04, 0.01], [0.01, 0.09]],
            "riskFreeRate": 0.02,
            "constraints": {"longOnly": true},
            "settings": {"iterations": 100}
        })").get<portfolio::MarkowitzParams>();

        REQUIRE(p.returns.size() == 2);
        REQUIRE(p.covariance[1][1] == Approx(0.09));
        REQUIRE(p.risk_free_rate == Approx(0.02));
        REQUIRE(p.constraints.has_value());
        REQUIRE(p.constraints->long_only);
        REQUIRE(p.settings.iterations == 100);
        REQUIRE(p.settings.step == Approx(0.01));
    }

    SECTION("Holdings") {
        auto h = json::parse(R"({"price": 25.5, "quantity": 40})").get<portfolio::Holding>();
        REQUIRE(h.value() == Approx(1020.0));
        json j = h;
        REQUIRE(j["quantity"] == 40.0);
    }
}

TEST_CASE("Result serialization", "[json]") {
    SECTION("Regression results") {
        json simple = stats::SimpleRegression{1.0, 2.0, 0.9, 0.1};
        REQUIRE(simple["rSquared"] == 0.9);
        REQUIRE(simple["standardError"] == 0.1);

        stats::MultipleRegression multi;
        multi.coefficients = {1.5, -0.5};
        json j = multi;
        REQUIRE(j["coefficients"].size() == 2);
        REQUIRE(j.contains("adjustedRSquared"));

        json ff = stats::FamaFrench3Result{0.001, 1.1, 0.2, -0.1, 0.8};
        REQUIRE(ff["smb"] == 0.2);
        REQUIRE(ff["hml"] == -0.1);
    }

    SECTION("Drawdown indices") {
        json j = risk::Drawdown{0.2, 1, 4};
        REQUIRE(j["maxDrawdown"] == 0.2);
        REQUIRE(j["peakIndex"] == 1);
        REQUIRE(j["troughIndex"] == 4);
    }

    SECTION("DCF parameters round trip") {
        auto p = json::parse(R"({
            "freeCashFlows": [100, 110, 120],
            "discountRate": 0.09,
            "terminalMultiple": 12
        })").get<valuation::DcfParams>();
        REQUIRE(p.free_cash_flows.size() == 3);
        REQUIRE(p.terminal_multiple == 12.0);
        REQUIRE_FALSE(p.terminal_year_fcf.has_value());
        REQUIRE(p.terminal_growth_rate == 0.0);

        json j = p;
        REQUIRE(j["terminalMultiple"] == 12.0);
        REQUIRE_FALSE(j.contains("terminalYearFcf"));
    }

    SECTION("Indicator bundles") {
        indicators::Bands b{{3.0}, {2.0}, {1.0}};
        json j = b;
        REQUIRE(j["upper"][0] == 3.0);
        REQUIRE(j["lower"][0] == 1.0);

        json greeks = options::Greeks{0.5, 0.02, -0.01, 0.3, 0.4};
        REQUIRE(greeks["theta"] == -0.01);
    }
}
