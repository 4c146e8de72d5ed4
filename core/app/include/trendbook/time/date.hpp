#pragma once

#include <cstdint>
#include <string>

namespace trendbook {

// -----------------------------------------------------------------------------
// Date: calendar day used throughout the backtest
// -----------------------------------------------------------------------------
//
// @brief  Signed count of days since 1970-01-01 in the proleptic Gregorian
//         calendar.
//
// @details
// Daily bars carry no intraday time, so a plain integer day count is enough
// and keeps every comparison and calendar-day difference a single integer
// operation. Holding periods ("calendar days held") are `today - entry`.
//
// Thread-safety: value type, stateless helpers.
// -----------------------------------------------------------------------------
using Date = std::int32_t;

// -------------------------------------------------------------------------
// make_date
// -------------------------------------------------------------------------
// @brief  Converts a civil (year, month, day) triple to a Date.
//
// @throws std::invalid_argument  if month or day is out of range.
// -------------------------------------------------------------------------
Date make_date(int year, unsigned month, unsigned day);

// -------------------------------------------------------------------------
// civil_from_date
// -------------------------------------------------------------------------
// @brief  Inverse of make_date(). Writes the civil triple for `date`.
// -------------------------------------------------------------------------
void civil_from_date(Date date, int& year, unsigned& month, unsigned& day);

// Calendar year of `date`. Used by year-dependent tax schedules.
int year_of(Date date);

// -------------------------------------------------------------------------
// parse_date
// -------------------------------------------------------------------------
// @brief  Parses an ISO "YYYY-MM-DD" string.
//
// @throws std::invalid_argument  on any other shape or an impossible date.
// -------------------------------------------------------------------------
Date parse_date(const std::string& text);

// Formats `date` as "YYYY-MM-DD".
std::string format_date(Date date);

}  // namespace trendbook
