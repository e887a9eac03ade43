#ifndef NRN_TOOLKIT_NRN_UTIL_H_
#define NRN_TOOLKIT_NRN_UTIL_H_

#include <cctype>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "NRNDate.hpp"

// Layout of a national register number: YYMMDD XXX CC.
//   * YYMMDD: birth date, two digit year.
//   * XXX: sequence number, 001 to 998. Odd last digit for men, even for women.
//   * CC: 97 - (YYMMDDXXX % 97). For births after 1999 the dividend gets a
//     leading 2, i.e. 2YYMMDDXXX.
class NRNUtil {
 public:
  static const int kLength = 11;
  static const int kBirthDateLength = 6;
  static const int kChecksumOffset = 9;
  static const int kDivisor = 97;
  static const int kMinSequenceNumber = 1;
  static const int kMaxSequenceNumber = 998;

  static NRNDate MinBirthDate() { return NRNDate{1900, 1, 1}; }

  static int ComputeChecksum(int64_t dividend) {
    return kDivisor - (int) (dividend % kDivisor);
  }

  // Checks whether the supplied string holds a valid number. Any non-digit
  // character is ignored, so "90.02.27-421.91" is as valid as "90022742191".
  static bool IsValid(const std::string& nrn) {
    std::string digits = FilterDigits(nrn);
    if (digits.size() != kLength) {
      // Wrong length, should be exactly 11 digits.
      return false;
    }

    int yy, mm, dd;
    if (!ParseBirthDigits(digits, &yy, &mm, &dd)) {
      return false;
    }
    // The century is unknown at this point. Feb 29th only exists in 2000,
    // not in 1900, and every other day is the same in both centuries.
    if (!NRNDate{1900 + yy, mm, dd}.IsValid() &&
        !NRNDate{2000 + yy, mm, dd}.IsValid()) {
      return false;
    }

    int64_t dividend = ParseNumber(digits, 0, kChecksumOffset);
    int actual_checksum = (int) ParseNumber(digits, kChecksumOffset, 2);

    // Born before 2000.
    if (ComputeChecksum(dividend) == actual_checksum) {
      return true;
    }
    // Born after 1999.
    return ComputeChecksum(kMillenniumPrefix + dividend) == actual_checksum;
  }

  // Builds the 11 digit number for the given birth date and sequence number.
  // Throws std::invalid_argument if the date is not a calendar date (e.g.
  // 1990-02-30), and std::out_of_range if it is before 1900-01-01 or the
  // sequence number is outside [1, 998].
  static std::string Encode(const NRNDate& birth_date, int sequence_number) {
    if (!birth_date.IsValid()) {
      throw std::invalid_argument("Birth date " + birth_date.ToString() +
                                  " is not a calendar date");
    }
    if (birth_date < MinBirthDate()) {
      throw std::out_of_range("Birth date can't be before " +
                              MinBirthDate().ToString());
    }
    if (sequence_number < kMinSequenceNumber ||
        sequence_number > kMaxSequenceNumber) {
      throw std::out_of_range(
          "Sequence number should be (inclusive) between " +
          std::to_string(kMinSequenceNumber) + " and " +
          std::to_string(kMaxSequenceNumber));
    }

    std::string nrn = PadNumber(birth_date.year % 100, 2) +
                      PadNumber(birth_date.month, 2) +
                      PadNumber(birth_date.day, 2) +
                      PadNumber(sequence_number, 3);
    int64_t dividend = ParseNumber(nrn, 0, kChecksumOffset);
    if (birth_date.year > 1999) {
      dividend += kMillenniumPrefix;
    }
    nrn += PadNumber(ComputeChecksum(dividend), 2);
    return nrn;
  }

  // This function takes a string and converts it into the canonical
  // representation (11 digits). The function returns true if the digits found
  // in the supplied string form a valid number, false otherwise.
  static bool ExtractDigits(const std::string& nrn_in, std::string* nrn_out) {
    *nrn_out = "";
    int digit_count = 0;
    for (char c : nrn_in) {
      if (isdigit((unsigned char) c)) {
        ++digit_count;
        // More than 11 digits is not a number we know, and most likely two
        // numbers ran into each other, so we also write to stderr.
        if (digit_count > kLength) {
          std::cerr << "NRNUtil::ExtractDigits encountered more than "
                    << kLength << " digits in the supplied string, this is"
                    << " probably not intended." << std::endl;
          *nrn_out = "";
          return false;
        }
        *nrn_out += c;
      }
    }

    bool is_valid = IsValid(*nrn_out);
    if (!is_valid) {
      *nrn_out = "";
    }
    return is_valid;
  }

  // Splits the first six digits into year, month and day. Only checks the
  // ranges of month (1-12) and day (1-31); digits must already be checked.
  static bool ParseBirthDigits(const std::string& digits, int* yy, int* mm,
                               int* dd) {
    *yy = (int) ParseNumber(digits, 0, 2);
    *mm = (int) ParseNumber(digits, 2, 2);
    *dd = (int) ParseNumber(digits, 4, 2);
    return *mm >= 1 && *mm <= 12 && *dd >= 1 && *dd <= 31;
  }

  static bool IsAllDigits(const std::string& s) {
    for (char c : s) {
      if (!isdigit((unsigned char) c)) {
        return false;
      }
    }
    return true;
  }

  static int64_t ParseNumber(const std::string& digits, size_t offset,
                             size_t count) {
    int64_t value = 0;
    for (size_t i = offset; i < offset + count; ++i) {
      value = value * 10 + (digits[i] - '0');
    }
    return value;
  }

  static std::string PadNumber(int64_t value, size_t width) {
    std::string s = std::to_string(value);
    if (s.size() < width) {
      s.insert(0, width - s.size(), '0');
    }
    return s;
  }

 private:
  // A leading '2' in front of the nine digit dividend.
  static const int64_t kMillenniumPrefix = 2000000000;

  static std::string FilterDigits(const std::string& s) {
    std::string digits;
    for (char c : s) {
      if (isdigit((unsigned char) c)) {
        digits += c;
      }
    }
    return digits;
  }
};

#endif  // NRN_TOOLKIT_NRN_UTIL_H_
