// QX Analytics - Technical Indicators Implementation

#include <qx/analytics/indicators.hpp>
#include <qx/analytics/error.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace qx::analytics::indicators {

namespace {

void require_period(int period, const char* name = "period") {
    if (period <= 0) {
        throw InvalidInputError(std::string(name) + " must be positive, got " +
                                std::to_string(period));
    }
}

void require_window(const Vector& series, int period) {
    require_period(period);
    detail::require_non_empty(series, "series");
    if (static_cast<size_t>(period) > series.size()) {
        throw InvalidInputError("period " + std::to_string(period) + " exceeds series length " +
                                std::to_string(series.size()));
    }
}

void require_history(size_t size, size_t needed) {
    if (size < needed) {
        throw InvalidInputError("need at least " + std::to_string(needed) +
                                " observations, got " + std::to_string(size));
    }
}

// RSI of a series: Wilder-smoothed average gain against average loss of
// successive changes, seeded by the simple averages of the first window
Vector wilder_rsi(const Vector& series, int period) {
    require_period(period);
    require_history(series.size(), static_cast<size_t>(period) + 1);

    auto value = [](double gain, double loss) {
        return loss == 0.0 ? 100.0 : 100.0 - 100.0 / (1.0 + gain / loss);
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = series[i] - series[i - 1];
        avg_gain += std::max(change, 0.0);
        avg_loss += std::max(-change, 0.0);
    }
    avg_gain /= period;
    avg_loss /= period;

    Vector out;
    out.reserve(series.size() - period);
    out.push_back(value(avg_gain, avg_loss));

    for (size_t i = period + 1; i < series.size(); ++i) {
        double change = series[i] - series[i - 1];
        avg_gain = (avg_gain * (period - 1) + std::max(change, 0.0)) / period;
        avg_loss = (avg_loss * (period - 1) + std::max(-change, 0.0)) / period;
        out.push_back(value(avg_gain, avg_loss));
    }
    return out;
}

}  // namespace

// =============================================================================
// Moving Averages
// =============================================================================

Vector sma(const Vector& prices, int period) {
    require_window(prices, period);

    Vector out;
    out.reserve(prices.size() - period + 1);
    double window = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        window += prices[i];
        if (i >= static_cast<size_t>(period)) {
            window -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out.push_back(window / period);
        }
    }
    return out;
}

Vector ema(const Vector& prices, int period) {
    require_window(prices, period);

    const double k = 2.0 / (period + 1);
    double seed = 0.0;
    for (int i = 0; i < period; ++i) {
        seed += prices[i];
    }

    Vector out;
    out.reserve(prices.size() - period + 1);
    out.push_back(seed / period);
    for (size_t i = period; i < prices.size(); ++i) {
        out.push_back((prices[i] - out.back()) * k + out.back());
    }
    return out;
}

Vector wma(const Vector& prices, int period) {
    require_window(prices, period);

    const double weight_sum = period * (period + 1) / 2.0;
    Vector out;
    out.reserve(prices.size() - period + 1);
    for (size_t i = period - 1; i < prices.size(); ++i) {
        double acc = 0.0;
        for (int j = 0; j < period; ++j) {
            acc += prices[i - period + 1 + j] * (j + 1);
        }
        out.push_back(acc / weight_sum);
    }
    return out;
}

Vector dema(const Vector& prices, int period) {
    Vector first = ema(prices, period);
    Vector second = ema(first, period);

    const size_t offset = first.size() - second.size();
    Vector out(second.size());
    for (size_t i = 0; i < second.size(); ++i) {
        out[i] = 2.0 * first[i + offset] - second[i];
    }
    return out;
}

// =============================================================================
// Momentum
// =============================================================================

Macd macd(const Vector& prices, int fast_period, int slow_period, int signal_period) {
    require_period(fast_period, "fast period");
    require_period(slow_period, "slow period");
    require_period(signal_period, "signal period");
    detail::require(fast_period < slow_period, "fast period must be below slow period");

    Vector fast = ema(prices, fast_period);
    Vector slow = ema(prices, slow_period);

    // Align both EMAs on their common tail
    Macd m;
    const size_t n = std::min(fast.size(), slow.size());
    const size_t fast_off = fast.size() - n;
    const size_t slow_off = slow.size() - n;
    m.macd.resize(n);
    for (size_t i = 0; i < n; ++i) {
        m.macd[i] = fast[i + fast_off] - slow[i + slow_off];
    }

    m.signal = ema(m.macd, signal_period);
    const size_t sig_off = m.macd.size() - m.signal.size();
    m.histogram.resize(m.signal.size());
    for (size_t i = 0; i < m.signal.size(); ++i) {
        m.histogram[i] = m.macd[i + sig_off] - m.signal[i];
    }
    return m;
}

Vector rsi(const Vector& prices, int period) {
    return wilder_rsi(prices, period);
}

Kdj kdj(const Vector& high, const Vector& low, const Vector& close,
        int period, int k_period, int d_period) {
    detail::require_same_size(high.size(), low.size(), "high vs low");
    detail::require_same_size(high.size(), close.size(), "high vs close");
    require_period(period);
    require_period(k_period, "K period");
    require_period(d_period, "D period");
    require_history(high.size(), static_cast<size_t>(period));

    Kdj out;
    double k = 50.0;
    double d = 50.0;
    for (size_t i = period - 1; i < high.size(); ++i) {
        auto first = static_cast<std::ptrdiff_t>(i - period + 1);
        auto last = static_cast<std::ptrdiff_t>(i + 1);
        double hh = *std::max_element(high.begin() + first, high.begin() + last);
        double ll = *std::min_element(low.begin() + first, low.begin() + last);

        double rsv = hh == ll ? 50.0 : (close[i] - ll) / (hh - ll) * 100.0;
        k = (k * (k_period - 1) + rsv) / k_period;
        d = (d * (d_period - 1) + k) / d_period;

        out.k.push_back(k);
        out.d.push_back(d);
        out.j.push_back(3.0 * k - 2.0 * d);
    }
    return out;
}

// =============================================================================
// Volatility
// =============================================================================

Bands bollinger_bands(const Vector& prices, int period, double multiplier) {
    require_window(prices, period);
    detail::require_positive(multiplier, "band multiplier");

    Bands b;
    for (size_t i = period - 1; i < prices.size(); ++i) {
        double mean = 0.0;
        for (int j = 0; j < period; ++j) {
            mean += prices[i - j];
        }
        mean /= period;

        double var = 0.0;
        for (int j = 0; j < period; ++j) {
            double dev = prices[i - j] - mean;
            var += dev * dev;
        }
        double width = multiplier * std::sqrt(var / period);

        b.middle.push_back(mean);
        b.upper.push_back(mean + width);
        b.lower.push_back(mean - width);
    }
    return b;
}

Vector atr(const Vector& high, const Vector& low, const Vector& close, int period) {
    detail::require_same_size(high.size(), low.size(), "high vs low");
    detail::require_same_size(high.size(), close.size(), "high vs close");
    require_period(period);
    require_history(high.size(), static_cast<size_t>(period) + 1);

    auto true_range = [&](size_t i) {
        return std::max({high[i] - low[i],
                         std::abs(high[i] - close[i - 1]),
                         std::abs(low[i] - close[i - 1])});
    };

    double seed = 0.0;
    for (int i = 1; i <= period; ++i) {
        seed += true_range(i);
    }

    Vector out;
    out.reserve(high.size() - period);
    out.push_back(seed / period);
    for (size_t i = period + 1; i < high.size(); ++i) {
        out.push_back((out.back() * (period - 1) + true_range(i)) / period);
    }
    return out;
}

Bands std_dev_channel(const Vector& prices, int period, double multiplier) {
    return bollinger_bands(prices, period, multiplier);
}

// =============================================================================
// Volume
// =============================================================================

Vector obv(const Vector& prices, const Vector& volumes) {
    detail::require_same_size(prices.size(), volumes.size(), "prices vs volumes");
    detail::require_non_empty(prices, "prices");

    Vector out;
    out.reserve(prices.size());
    double running = volumes[0];
    out.push_back(running);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i] > prices[i - 1]) {
            running += volumes[i];
        } else if (prices[i] < prices[i - 1]) {
            running -= volumes[i];
        }
        out.push_back(running);
    }
    return out;
}

Vector volume_ma(const Vector& volumes, int period) {
    return sma(volumes, period);
}

Vector volume_rsi(const Vector& volumes, int period) {
    return wilder_rsi(volumes, period);
}

Vector volume_ratio(const Vector& prices, const Vector& volumes, int period) {
    detail::require_same_size(prices.size(), volumes.size(), "prices vs volumes");
    require_period(period);
    require_history(prices.size(), static_cast<size_t>(period) + 1);

    Vector out;
    out.reserve(prices.size() - period);
    for (size_t i = period; i < prices.size(); ++i) {
        const double reference = prices[i - period];
        double up = 0.0;
        double down = 0.0;
        double flat = 0.0;

        for (size_t j = i - period + 1; j <= i; ++j) {
            if (prices[j] > reference) {
                up += volumes[j];
            } else if (prices[j] < reference) {
                down += volumes[j];
            } else {
                flat += volumes[j];
            }
        }

        double denom = down + flat / 2.0;
        out.push_back(denom == 0.0 ? 100.0 : (up + flat / 2.0) / denom * 100.0);
    }
    return out;
}

Vector accumulation_distribution(const Vector& high, const Vector& low, const Vector& close,
                                 const Vector& volumes) {
    detail::require_same_size(high.size(), low.size(), "high vs low");
    detail::require_same_size(high.size(), close.size(), "high vs close");
    detail::require_same_size(high.size(), volumes.size(), "high vs volumes");
    detail::require_non_empty(high, "prices");

    Vector out;
    out.reserve(high.size());
    double running = 0.0;
    for (size_t i = 0; i < high.size(); ++i) {
        double range = high[i] - low[i];
        if (range != 0.0) {
            double multiplier = ((close[i] - low[i]) - (high[i] - close[i])) / range;
            running += multiplier * volumes[i];
        }
        out.push_back(running);
    }
    return out;
}

}  // namespace qx::analytics::indicators
