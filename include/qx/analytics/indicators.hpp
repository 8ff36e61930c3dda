// QX Analytics - Technical Indicators
// Moving averages, momentum, volatility bands and volume indicators

#pragma once

#include <qx/analytics/types.hpp>

namespace qx::analytics::indicators {

// Output series start at the first full window, so each is shorter than its
// input. Insufficient history or a non-positive period raises InvalidInputError.

// =============================================================================
// Moving Averages
// =============================================================================

Vector sma(const Vector& prices, int period);

// Seeded with the SMA of the first window, multiplier 2 / (period + 1)
Vector ema(const Vector& prices, int period);

// Linear weights 1..period, heaviest on the latest price
Vector wma(const Vector& prices, int period);

// 2 * EMA - EMA(EMA)
Vector dema(const Vector& prices, int period);

// =============================================================================
// Momentum
// =============================================================================

struct Macd {
    Vector macd;
    Vector signal;
    Vector histogram;
};

// fast_period must be below slow_period
Macd macd(const Vector& prices, int fast_period = 12, int slow_period = 26,
          int signal_period = 9);

// Wilder-smoothed relative strength index; 100 when there are no losses
Vector rsi(const Vector& prices, int period = 14);

struct Kdj {
    Vector k;
    Vector d;
    Vector j;
};

// Stochastic oscillator with K and D smoothed from 50
Kdj kdj(const Vector& high, const Vector& low, const Vector& close,
        int period = 9, int k_period = 3, int d_period = 3);

// =============================================================================
// Volatility
// =============================================================================

struct Bands {
    Vector upper;
    Vector middle;
    Vector lower;
};

// SMA +/- multiplier * population standard deviation of the window
Bands bollinger_bands(const Vector& prices, int period = 20, double multiplier = 2.0);

// Wilder-smoothed true range
Vector atr(const Vector& high, const Vector& low, const Vector& close, int period = 14);

// Mean +/- multiplier * population standard deviation of the window
Bands std_dev_channel(const Vector& prices, int period = 20, double multiplier = 2.0);

// =============================================================================
// Volume
// =============================================================================

// On-balance volume, starting from the first volume
Vector obv(const Vector& prices, const Vector& volumes);

Vector volume_ma(const Vector& volumes, int period = 20);

// RSI computed over volume changes
Vector volume_rsi(const Vector& volumes, int period = 14);

// Up volume (plus half the unchanged) over down volume (plus half the
// unchanged), in percent, against the price period bars back; 100 when the
// denominator is 0
Vector volume_ratio(const Vector& prices, const Vector& volumes, int period = 26);

// Cumulative money-flow volume; bars with high == low add nothing
Vector accumulation_distribution(const Vector& high, const Vector& low, const Vector& close,
                                 const Vector& volumes);

}  // namespace qx::analytics::indicators
