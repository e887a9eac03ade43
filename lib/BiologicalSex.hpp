#ifndef NRN_TOOLKIT_BIOLOGICAL_SEX_H_
#define NRN_TOOLKIT_BIOLOGICAL_SEX_H_

#include <string>

// Encoded by the last digit of the sequence number: even is female, odd is
// male.
enum class BiologicalSex {
  kFemale,
  kMale,
};

inline std::string ToString(BiologicalSex sex) {
  return sex == BiologicalSex::kFemale ? "female" : "male";
}

#endif  // NRN_TOOLKIT_BIOLOGICAL_SEX_H_
