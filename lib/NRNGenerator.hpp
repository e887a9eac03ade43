#ifndef NRN_TOOLKIT_NRN_GENERATOR_H_
#define NRN_TOOLKIT_NRN_GENERATOR_H_

#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "BiologicalSex.hpp"
#include "NRNDate.hpp"
#include "NRNUtil.hpp"

// Produces random, valid numbers for test data. All methods lock, so a single
// instance (see Shared()) can be used from any number of threads.
class NRNGenerator {
 public:
  NRNGenerator()
      : mt_(std::random_device()()), today_(&NRNDate::Today) {}

  // Deterministic generator. |today| bounds the default birth date range.
  NRNGenerator(uint32_t seed, std::function<NRNDate()> today)
      : mt_(seed), today_(std::move(today)) {}

  NRNGenerator(const NRNGenerator&) = delete;
  NRNGenerator& operator=(const NRNGenerator&) = delete;

  static NRNGenerator& Shared() {
    static NRNGenerator shared;
    return shared;
  }

  std::string Generate() {
    return NRNUtil::Encode(RandomBirthDate(), RandomSequenceNumber());
  }

  std::string Generate(const NRNDate& birth_date) {
    return NRNUtil::Encode(birth_date, RandomSequenceNumber());
  }

  std::string Generate(BiologicalSex sex) {
    return NRNUtil::Encode(RandomBirthDate(), RandomSequenceNumber(sex));
  }

  std::string Generate(const NRNDate& birth_date, BiologicalSex sex) {
    return NRNUtil::Encode(birth_date, RandomSequenceNumber(sex));
  }

  std::string Generate(const NRNDate& min_date, const NRNDate& max_date) {
    return Generate(RandomBirthDate(min_date, max_date));
  }

  std::string Generate(const NRNDate& min_date, const NRNDate& max_date,
                       BiologicalSex sex) {
    return Generate(RandomBirthDate(min_date, max_date), sex);
  }

  int RandomSequenceNumber() {
    std::uniform_int_distribution<int> dist(NRNUtil::kMinSequenceNumber,
                                            NRNUtil::kMaxSequenceNumber);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(mt_);
  }

  // Moves a uniform draw to the nearest number of the right parity. 998 is
  // even and 1 is odd, so the result never leaves [1, 998].
  int RandomSequenceNumber(BiologicalSex sex) {
    int sequence_number = RandomSequenceNumber();
    if (sex == BiologicalSex::kFemale) {
      if (sequence_number % 2 != 0) {
        ++sequence_number;
      }
    } else {
      if (sequence_number % 2 == 0) {
        --sequence_number;
      }
    }
    return sequence_number;
  }

  // Uniform between 1900-01-01 and today, both included.
  NRNDate RandomBirthDate() {
    return RandomBirthDate(NRNUtil::MinBirthDate(), today_());
  }

  NRNDate RandomBirthDate(const NRNDate& min_date, const NRNDate& max_date) {
    if (min_date > max_date) {
      throw std::invalid_argument("Minimum date " + min_date.ToString() +
                                  " can't be after maximum date " +
                                  max_date.ToString());
    }
    int64_t range = max_date.ToDays() - min_date.ToDays();
    std::uniform_int_distribution<int64_t> dist(0, range);
    int64_t offset;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      offset = dist(mt_);
    }
    return min_date.AddDays(offset);
  }

 private:
  std::mutex mutex_;
  std::mt19937 mt_;
  std::function<NRNDate()> today_;
};

#endif  // NRN_TOOLKIT_NRN_GENERATOR_H_
