#ifndef NRN_TOOLKIT_NRN_DATE_H_
#define NRN_TOOLKIT_NRN_DATE_H_

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

// A proleptic Gregorian calendar day. Plain aggregate, so it can be written
// as NRNDate{1990, 2, 27}.
struct NRNDate {
  int year;
  int month;
  int day;

  static bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  }

  static int DaysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      return 0;
    }
    if (month == 2 && IsLeapYear(year)) {
      return 29;
    }
    return days[month - 1];
  }

  bool IsValid() const {
    return month >= 1 && month <= 12 && day >= 1 &&
           day <= DaysInMonth(year, month);
  }

  // Number of days since 1970-01-01 (negative before).
  int64_t ToDays() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
  }

  static NRNDate FromDays(int64_t days) {
    days += 719468;
    int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    int64_t doe = days - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int d = (int) (doy - (153 * mp + 2) / 5 + 1);
    int m = (int) (mp < 10 ? mp + 3 : mp - 9);
    int y = (int) (yoe + era * 400 + (m <= 2 ? 1 : 0));
    return NRNDate{y, m, d};
  }

  NRNDate AddDays(int64_t count) const {
    return FromDays(ToDays() + count);
  }

  // Current UTC date from the system clock.
  static NRNDate Today() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto hours = std::chrono::duration_cast<std::chrono::hours>(since_epoch);
    int64_t days = hours.count() / 24;
    if (hours.count() < 0 && hours.count() % 24 != 0) {
      --days;
    }
    return FromDays(days);
  }

  // Parses "YYYY-MM-DD". Returns false on anything else, including dates
  // that do not exist.
  static bool Parse(const std::string& iso, NRNDate* date) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
      return false;
    }
    for (size_t i = 0; i < iso.size(); ++i) {
      if (i == 4 || i == 7) continue;
      if (!isdigit((unsigned char) iso[i])) {
        return false;
      }
    }
    NRNDate parsed{std::stoi(iso.substr(0, 4)), std::stoi(iso.substr(5, 2)),
                   std::stoi(iso.substr(8, 2))};
    if (!parsed.IsValid()) {
      return false;
    }
    *date = parsed;
    return true;
  }

  std::string ToString() const {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
  }
};

inline bool operator==(const NRNDate& a, const NRNDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool operator!=(const NRNDate& a, const NRNDate& b) {
  return !(a == b);
}

inline bool operator<(const NRNDate& a, const NRNDate& b) {
  if (a.year != b.year) return a.year < b.year;
  if (a.month != b.month) return a.month < b.month;
  return a.day < b.day;
}

inline bool operator>(const NRNDate& a, const NRNDate& b) { return b < a; }
inline bool operator<=(const NRNDate& a, const NRNDate& b) { return !(b < a); }
inline bool operator>=(const NRNDate& a, const NRNDate& b) { return !(a < b); }

#endif  // NRN_TOOLKIT_NRN_DATE_H_
