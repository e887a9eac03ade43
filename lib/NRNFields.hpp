#ifndef NRN_TOOLKIT_NRN_FIELDS_H_
#define NRN_TOOLKIT_NRN_FIELDS_H_

#include <cctype>
#include <string>

#include "BiologicalSex.hpp"
#include "NRNDate.hpp"
#include "NRNUtil.hpp"

// Reads single fields out of an 11 digit number. None of these check the
// checksum; call NRNUtil::IsValid first when the number has to be correct.
class NRNFields {
 public:
  // Sex is the parity of the last sequence digit (index 8). Returns false and
  // leaves *sex alone unless the input is exactly 11 digits.
  static bool TryExtractSex(const std::string& nrn, BiologicalSex* sex) {
    if (!HasNumberShape(nrn)) {
      return false;
    }
    int digit = nrn[8] - '0';
    *sex = digit % 2 == 0 ? BiologicalSex::kFemale : BiologicalSex::kMale;
    return true;
  }

  // The year is 19YY when the pre-2000 checksum matches, 20YY otherwise.
  // A number matching neither checksum still gets 20YY.
  static bool TryExtractBirthDate(const std::string& nrn, NRNDate* birth_date) {
    if (!HasNumberShape(nrn)) {
      return false;
    }

    int yy, mm, dd;
    if (!NRNUtil::ParseBirthDigits(nrn, &yy, &mm, &dd)) {
      return false;
    }

    int64_t dividend = NRNUtil::ParseNumber(nrn, 0, NRNUtil::kChecksumOffset);
    std::string checksum =
        NRNUtil::PadNumber(NRNUtil::ComputeChecksum(dividend), 2);
    bool born_before_2000 = nrn.compare(NRNUtil::kChecksumOffset, 2, checksum) == 0;

    NRNDate date{(born_before_2000 ? 1900 : 2000) + yy, mm, dd};
    if (!date.IsValid()) {
      // Day 31 in a short month, or Feb 29th in a non leap year.
      return false;
    }
    *birth_date = date;
    return true;
  }

  // Formats as YY.MM.DD-XXX.CC. Anything blank or not 11 characters long is
  // returned as is. Does not check if the number is valid!
  static std::string ToFormatted(const std::string& nrn) {
    if (IsBlank(nrn) || nrn.size() != NRNUtil::kLength) {
      return nrn;
    }
    return nrn.substr(0, 2) + "." + nrn.substr(2, 2) + "." + nrn.substr(4, 2) +
           "-" + nrn.substr(6, 3) + "." + nrn.substr(9, 2);
  }

 private:
  static bool HasNumberShape(const std::string& nrn) {
    return nrn.size() == NRNUtil::kLength && NRNUtil::IsAllDigits(nrn);
  }

  static bool IsBlank(const std::string& s) {
    for (char c : s) {
      if (!isspace((unsigned char) c)) {
        return false;
      }
    }
    return true;
  }
};

#endif  // NRN_TOOLKIT_NRN_FIELDS_H_
