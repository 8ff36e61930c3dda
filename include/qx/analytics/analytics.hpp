// QX Analytics - Main Header
// Include this to get the whole library

#pragma once

#include <qx/analytics/bonds.hpp>
#include <qx/analytics/config.hpp>
#include <qx/analytics/error.hpp>
#include <qx/analytics/indicators.hpp>
#include <qx/analytics/log.hpp>
#include <qx/analytics/math.hpp>
#include <qx/analytics/options.hpp>
#include <qx/analytics/portfolio.hpp>
#include <qx/analytics/random.hpp>
#include <qx/analytics/risk.hpp>
#include <qx/analytics/stats.hpp>
#include <qx/analytics/types.hpp>
#include <qx/analytics/valuation.hpp>

namespace qx::analytics {

constexpr const char* VERSION = "1.0.0";

}  // namespace qx::analytics
