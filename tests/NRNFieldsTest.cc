#include <string>

#include <gtest/gtest.h>

#include "BiologicalSex.hpp"
#include "NRNDate.hpp"
#include "NRNFields.hpp"
#include "NRNUtil.hpp"

TEST(NRNFieldsTest, ExtractsBirthDate) {
  struct {
    const char* nrn;
    NRNDate expected;
  } cases[] = {
    {"90022742191", NRNDate{1990, 2, 27}},
    {"00010100121", NRNDate{2000, 1, 1}},
    {"00010100105", NRNDate{2000, 1, 1}},
    {"05010156780", NRNDate{2005, 1, 1}},
    {"80052600458", NRNDate{1980, 5, 26}},
    {"00010100173", NRNDate{1900, 1, 1}},
  };
  for (const auto& c : cases) {
    NRNDate birth_date{0, 0, 0};
    EXPECT_TRUE(NRNFields::TryExtractBirthDate(c.nrn, &birth_date)) << c.nrn;
    EXPECT_EQ(c.expected, birth_date) << c.nrn;
  }
}

TEST(NRNFieldsTest, BirthDateFallsBackTo2000sWithoutChecksumMatch) {
  // Neither checksum (87 for 19xx, 19 for 20xx) matches 91; extraction does
  // not validate and assumes the later century.
  NRNDate birth_date{0, 0, 0};
  EXPECT_FALSE(NRNUtil::IsValid("99010199991"));
  EXPECT_TRUE(NRNFields::TryExtractBirthDate("99010199991", &birth_date));
  EXPECT_EQ((NRNDate{2099, 1, 1}), birth_date);
}

TEST(NRNFieldsTest, BirthDateOfEncodedNumbersMatches) {
  NRNDate birth_date{0, 0, 0};
  std::string nrn = NRNUtil::Encode(NRNDate{2000, 1, 1}, 1);
  EXPECT_TRUE(NRNUtil::IsValid(nrn));
  EXPECT_TRUE(NRNFields::TryExtractBirthDate(nrn, &birth_date));
  EXPECT_EQ((NRNDate{2000, 1, 1}), birth_date);

  EXPECT_TRUE(NRNFields::TryExtractBirthDate("90022742123", &birth_date));
  EXPECT_EQ((NRNDate{2090, 2, 27}), birth_date);
}

TEST(NRNFieldsTest, BirthDateRejectsMalformedInput) {
  for (const char* nrn : {"12345678910", "00000000000", "99999999999",
                          "abcdefghijk", "", "   ", "           ", "12345",
                          "123456789012", "1234567890", "123456789012345",
                          "90.02.27-421.91", "90043112345"}) {
    NRNDate birth_date{1, 2, 3};
    EXPECT_FALSE(NRNFields::TryExtractBirthDate(nrn, &birth_date)) << nrn;
    EXPECT_EQ((NRNDate{1, 2, 3}), birth_date) << nrn;
  }
}

TEST(NRNFieldsTest, BirthDateRejectsLeapDayIn1900) {
  // 16 is the pre-2000 checksum of 000229001, so the century resolves to 1900
  // where Feb 29th doesn't exist.
  NRNDate birth_date{0, 0, 0};
  EXPECT_FALSE(NRNFields::TryExtractBirthDate("00022900116", &birth_date));
  EXPECT_TRUE(NRNFields::TryExtractBirthDate("00022900145", &birth_date));
  EXPECT_EQ((NRNDate{2000, 2, 29}), birth_date);
}

TEST(NRNFieldsTest, ExtractsSex) {
  struct {
    const char* nrn;
    BiologicalSex expected;
  } cases[] = {
    {"90022742192", BiologicalSex::kMale},
    {"80052600458", BiologicalSex::kFemale},
    {"03071512331", BiologicalSex::kMale},
    {"95041224690", BiologicalSex::kFemale},
    {"82061878947", BiologicalSex::kMale},
    {"01010135624", BiologicalSex::kFemale},
  };
  for (const auto& c : cases) {
    BiologicalSex sex = c.expected == BiologicalSex::kMale
                            ? BiologicalSex::kFemale
                            : BiologicalSex::kMale;
    EXPECT_TRUE(NRNFields::TryExtractSex(c.nrn, &sex)) << c.nrn;
    EXPECT_EQ(c.expected, sex) << c.nrn;
  }
}

TEST(NRNFieldsTest, ExtractsSexDespiteBadChecksum) {
  BiologicalSex sex = BiologicalSex::kFemale;
  EXPECT_TRUE(NRNFields::TryExtractSex("90022742194", &sex));
  EXPECT_EQ(BiologicalSex::kMale, sex);
  EXPECT_TRUE(NRNFields::TryExtractSex("80052600450", &sex));
  EXPECT_EQ(BiologicalSex::kFemale, sex);
  EXPECT_TRUE(NRNFields::TryExtractSex("00010100122", &sex));
  EXPECT_EQ(BiologicalSex::kMale, sex);
}

TEST(NRNFieldsTest, SexRejectsMalformedInput) {
  for (const char* nrn : {"123", "1234567890", "abcdefghijk", "", "   ",
                          "           ", "12345", "123456789012"}) {
    BiologicalSex sex = BiologicalSex::kMale;
    EXPECT_FALSE(NRNFields::TryExtractSex(nrn, &sex)) << nrn;
    EXPECT_EQ(BiologicalSex::kMale, sex) << nrn;
  }
}

TEST(NRNFieldsTest, FormatsElevenCharacters) {
  EXPECT_EQ("90.02.27-421.91", NRNFields::ToFormatted("90022742191"));
  EXPECT_EQ("12.34.56-789.10", NRNFields::ToFormatted("12345678910"));
  EXPECT_EQ("00.00.00-000.00", NRNFields::ToFormatted("00000000000"));
  // No validation at all.
  EXPECT_EQ("ab.cd.ef-ghi.jk", NRNFields::ToFormatted("abcdefghijk"));
}

TEST(NRNFieldsTest, FormatLeavesOtherInputAlone) {
  for (const char* s : {"", "short", "invalid", "   ", "           ", "12345",
                        "123456789012", "1234567890", "123456789012345",
                        "90.02.27-421.91"}) {
    EXPECT_EQ(s, NRNFields::ToFormatted(s));
  }
}

TEST(NRNFieldsTest, FormatIsPure) {
  EXPECT_EQ(NRNFields::ToFormatted("90022742191"),
            NRNFields::ToFormatted("90022742191"));
  EXPECT_TRUE(NRNUtil::IsValid(NRNFields::ToFormatted("90022742191")));
}
