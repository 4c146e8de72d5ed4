#include "trendbook/time/date.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace trendbook {

namespace {

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30,
                                     31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Reads `count` decimal digits starting at `pos`. Returns -1 on a non-digit.
int readDigits(const std::string& text, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (!std::isdigit(c)) {
      return -1;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// make_date: days-from-civil over 400-year eras
// -----------------------------------------------------------------------------
Date make_date(int year, unsigned month, unsigned day) {
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
    throw std::invalid_argument("invalid calendar date " +
                                std::to_string(year) + "-" +
                                std::to_string(month) + "-" +
                                std::to_string(day));
  }

  // Shift the year so it starts in March; February's leap day then falls at
  // the end of the shifted year.
  const int y = year - (month <= 2 ? 1 : 0);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned mp = month > 2 ? month - 3 : month + 9;
  const unsigned doy = (153 * mp + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<Date>(era * 146097 + static_cast<int>(doe) - 719468);
}

// -----------------------------------------------------------------------------
// civil_from_date: inverse of make_date
// -----------------------------------------------------------------------------
void civil_from_date(Date date, int& year, unsigned& month, unsigned& day) {
  const int z = static_cast<int>(date) + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

int year_of(Date date) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_date(date, year, month, day);
  return year;
}

// -----------------------------------------------------------------------------
// parse_date: strict "YYYY-MM-DD"
// -----------------------------------------------------------------------------
Date parse_date(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw std::invalid_argument("expected YYYY-MM-DD date, got '" + text +
                                "'");
  }
  const int year = readDigits(text, 0, 4);
  const int month = readDigits(text, 5, 2);
  const int day = readDigits(text, 8, 2);
  if (year < 0 || month < 0 || day < 0) {
    throw std::invalid_argument("expected YYYY-MM-DD date, got '" + text +
                                "'");
  }
  return make_date(year, static_cast<unsigned>(month),
                   static_cast<unsigned>(day));
}

std::string format_date(Date date) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_date(date, year, month, day);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
  return std::string(buf);
}

}  // namespace trendbook
