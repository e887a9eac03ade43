#ifndef NRN_TOOLKIT_NRN_EXTRACTOR_H_
#define NRN_TOOLKIT_NRN_EXTRACTOR_H_

#include <cctype>
#include <string>
#include <unordered_set>

#include "NRNUtil.hpp"

// Scans free text for national register numbers.
//
// Every digit of the text is tried as the first digit of a number. From there
// the scanner walks forward, collecting digits and skipping the separators the
// mode allows, until it holds 11 digits. The walk is abandoned as soon as the
// collected YYMMDD prefix can't be a month or a day, so a stray digit in front
// of a number ("page 1 90.02.27-421.91") never hides it.
class NRNExtractor {
 public:
  enum class Mode {
    // 11 digits, at most one of ' ', '.', '-' between two digits, at most
    // 5 digit groups (YY MM DD XXX CC).
    kStandard,
    // More separators and typos, up to two of them between two digits and
    // up to 7 digit groups.
    kThorough,
    // Any two characters between two digits, any number of groups, and the
    // number may be glued to other digits.
    kParanoid,
  };

  explicit NRNExtractor(Mode mode) : rules_(RulesFor(mode)) {}

  // Parses "standard", "thorough" or "paranoid".
  static bool ParseMode(const std::string& name, Mode* mode) {
    if (name == "standard") {
      *mode = Mode::kStandard;
    } else if (name == "thorough") {
      *mode = Mode::kThorough;
    } else if (name == "paranoid") {
      *mode = Mode::kParanoid;
    } else {
      return false;
    }
    return true;
  }

  void Process(const std::string& text) {
    std::string digits;
    for (size_t i = 0; i < text.size(); ++i) {
      if (!IsDigit(text[i])) {
        continue;
      }
      if (rules_.digit_boundary && i > 0 && IsDigit(text[i - 1])) {
        continue;
      }
      if (MatchAt(text, i, &digits)) {
        Matched(digits);
      }
    }
  }

  // Gives access to the results set (canonical 11 digit numbers).
  const std::unordered_set<std::string>& Results() const {
    return results_;
  }

 private:
  struct Rules {
    // Characters allowed between two digits. Empty means anything goes.
    std::string separators;
    size_t max_gap;
    int max_digit_groups;
    // Reject numbers glued to other digits on either side.
    bool digit_boundary;
  };

  static Rules RulesFor(Mode mode) {
    switch (mode) {
      case Mode::kStandard:
        return Rules{" .-", 1, 5, true};
      case Mode::kThorough:
        // ',' '*' ':' ';' are typos: keys next to the standard separators,
        // or reached with shift on or around them on AZERTY and QWERTY.
        return Rules{" .-/_\t,*:;", 2, 7, true};
      case Mode::kParanoid:
        return Rules{"", 2, 11, false};
    }
    return Rules{" .-", 1, 5, true};
  }

  static bool IsDigit(char c) {
    return isdigit((unsigned char) c) != 0;
  }

  bool IsSeparator(char c) const {
    return rules_.separators.empty() ||
           rules_.separators.find(c) != std::string::npos;
  }

  // Checks the birth date part of a partially collected number. Month 00 and
  // day 00 are rejected here, the full calendar check happens in IsValid.
  static bool PlausiblePrefix(const std::string& digits) {
    if (digits.size() == 4) {
      int month = NRNUtil::ParseNumber(digits, 2, 2);
      return month >= 1 && month <= 12;
    }
    if (digits.size() == 6) {
      int day = NRNUtil::ParseNumber(digits, 4, 2);
      return day >= 1 && day <= 31;
    }
    return true;
  }

  // Collects the 11 digits of a number starting at text[start] into *digits.
  bool MatchAt(const std::string& text, size_t start,
               std::string* digits) const {
    digits->clear();
    int digit_groups = 1;
    size_t pos = start;
    while (true) {
      digits->push_back(text[pos]);
      if (!PlausiblePrefix(*digits)) {
        return false;
      }
      if (digits->size() == static_cast<size_t>(NRNUtil::kLength)) {
        break;
      }

      size_t gap = 0;
      ++pos;
      while (pos < text.size() && !IsDigit(text[pos])) {
        if (gap == rules_.max_gap || !IsSeparator(text[pos])) {
          return false;
        }
        ++gap;
        ++pos;
      }
      if (pos == text.size()) {
        return false;
      }
      if (gap > 0 && ++digit_groups > rules_.max_digit_groups) {
        return false;
      }
    }
    return !rules_.digit_boundary || pos + 1 == text.size() ||
           !IsDigit(text[pos + 1]);
  }

  void Matched(const std::string& digits) {
    std::string nrn;
    if (NRNUtil::ExtractDigits(digits, &nrn)) {
      results_.insert(nrn);
    }
  }

  const Rules rules_;

  // We use a set to avoid storing duplicates.
  std::unordered_set<std::string> results_;
};

#endif  // NRN_TOOLKIT_NRN_EXTRACTOR_H_
