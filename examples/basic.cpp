// QX Analytics - Basic Example
// Walks through option pricing, bonds, portfolio optimization and regression

#include <qx/analytics/analytics.hpp>
#include <iomanip>
#include <iostream>

using namespace qx::analytics;

int main() {
    // Build configuration
    Config config;
    config.set_log_level("warn")
          .set_seed(42)
          .set_optimizer_iterations(5000);
    config.apply();

    try {
        // Options
        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Options (S=100 K=100 T=1 r=5% sigma=20%)\n";
        double call = options::black_scholes(100, 100, 1, 0.05, 0.2, OptionType::Call);
        double put = options::black_scholes(100, 100, 1, 0.05, 0.2, OptionType::Put);
        double american_put = options::american_option(100, 100, 1, 0.05, 0.2, 200, OptionType::Put);
        std::cout << "  call:         " << call << "\n"
                  << "  put:          " << put << "\n"
                  << "  american put: " << american_put << "\n";

        auto g = options::greeks(100, 100, 1, 0.05, 0.2);
        std::cout << "  delta " << g.delta << "  gamma " << g.gamma
                  << "  theta/day " << g.theta << "  vega " << g.vega << "\n";

        auto iv = options::implied_volatility(call, 100, 100, 1, 0.05, OptionType::Call,
                                              config.implied_vol_settings());
        std::cout << "  implied vol:  " << iv.value
                  << (iv.converged ? "" : " (not converged)") << "\n";

        // Bonds
        std::cout << "\nBond (1000 face, 5% semiannual coupon, 10 years)\n";
        double price = bonds::bond_price(1000, 0.05, 0.06, 10);
        auto ytm = bonds::yield_to_maturity(1000, 0.05, price, 10, bonds::DEFAULT_FREQUENCY,
                                            config.yield_settings());
        double mod_dur = bonds::modified_duration(1000, 0.05, 0.06, 10);
        double conv = bonds::convexity(1000, 0.05, 0.06, 10);
        std::cout << "  price at 6%:       " << price << "\n"
                  << "  yield to maturity: " << ytm.value << "\n"
                  << "  modified duration: " << mod_dur << "\n"
                  << "  convexity:         " << conv << "\n"
                  << "  price if +100bp:   "
                  << bonds::estimate_price(price, mod_dur, conv, 0.01) << "\n";

        // Portfolio
        std::cout << "\nPortfolio (3 assets, long only)\n";
        portfolio::MarkowitzParams params;
        params.returns = {0.08, 0.12, 0.15};
        params.covariance = {
            {0.04, 0.006, 0.01},
            {0.006, 0.09, 0.02},
            {0.01, 0.02, 0.16}
        };
        params.risk_free_rate = 0.02;
        params.constraints = portfolio::WeightConstraints{}.with_long_only();
        params.settings = config.optimizer_settings();

        SeededRandom rng(*config.optimizer.seed);
        auto best = portfolio::max_sharpe_portfolio(params, rng);
        std::cout << "  max sharpe weights:";
        for (double w : best.weights) std::cout << " " << w;
        std::cout << "\n  return " << best.expected_return
                  << "  volatility " << best.volatility
                  << "  sharpe " << best.sharpe_ratio.value_or(0.0) << "\n";

        // Regression
        std::cout << "\nCAPM regression\n";
        Vector market = {0.01, -0.02, 0.015, 0.03, -0.01, 0.02};
        Vector stock = {0.012, -0.025, 0.02, 0.04, -0.015, 0.022};
        auto capm = stats::capm_regression(stock, market, 0.001);
        std::cout << "  alpha " << capm.alpha << "  beta " << capm.beta
                  << "  r2 " << capm.r_squared << "\n";

    } catch (const AnalyticsError& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
