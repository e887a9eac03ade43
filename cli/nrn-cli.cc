#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <string>

#include "BiologicalSex.hpp"
#include "NRNDate.hpp"
#include "NRNFields.hpp"
#include "NRNUtil.hpp"

using namespace std::chrono;

void PrintUsage() {
  std::cerr << "Usage: ./nrn-cli validate|format|sex|birthdate [quiet|time]"
            << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 3) {
    PrintUsage();
    exit(1);
  }

  std::string action(argv[1]);

  // Sort out quiet arg.
  bool quiet = false, time = false;
  if (argc == 3) {
    if (strcmp(argv[2], "quiet") == 0) {
      quiet = true;
    } else if (strcmp(argv[2], "time") == 0) {
      time = true;
    } else {
      PrintUsage();
      exit(1);
    }
  }

  // One lambda per action.
  auto validate_fn = [&] (const std::string& nrn) -> void {
    bool result = NRNUtil::IsValid(nrn);
    if (quiet) return;
    std::cout << (result ? "true" : "false") << "\n";
  };
  auto format_fn = [&] (const std::string& nrn) -> void {
    std::string result = NRNFields::ToFormatted(nrn);
    if (quiet) return;
    std::cout << result << "\n";
  };
  auto sex_fn = [&] (const std::string& nrn) -> void {
    BiologicalSex sex = BiologicalSex::kFemale;
    bool result = NRNFields::TryExtractSex(nrn, &sex);
    if (quiet) return;
    std::cout << (result ? ToString(sex) : "unknown") << "\n";
  };
  auto birthdate_fn = [&] (const std::string& nrn) -> void {
    NRNDate birth_date{0, 0, 0};
    bool result = NRNFields::TryExtractBirthDate(nrn, &birth_date);
    if (quiet) return;
    std::cout << (result ? birth_date.ToString() : "unknown") << "\n";
  };

  // Choose the lambda based on action arg.
  std::function<void(const std::string& nrn)> f;
  if (action == "validate") {
    f = validate_fn;
  } else if (action == "format") {
    f = format_fn;
  } else if (action == "sex") {
    f = sex_fn;
  } else if (action == "birthdate") {
    f = birthdate_fn;
  } else {
    std::cerr << "Unknown action \"" << action << "\"." << std::endl;
    PrintUsage();
    exit(1);
  }

  // Read all lines, execute action.
  std::ios::sync_with_stdio(false);
  std::string nrn;

  int line_count = 0;
  auto start = high_resolution_clock::now();
  while (std::getline(std::cin, nrn)) {
    f(nrn);
    ++line_count;
  }
  std::cout.flush();
  if (line_count == 0) return 1;
  auto stop = high_resolution_clock::now();
  auto duration_us = duration_cast<microseconds>(stop - start);
  auto duration_ms = duration_cast<milliseconds>(stop - start);
  if (time) {
    std::cout << "Took " << duration_ms.count() << "ms." << std::endl;
    if (duration_us.count() > 0) {
      int64_t qps = (int64_t) line_count * 1000000 / duration_us.count();
      std::cout << "QPS: " << qps << std::endl;
    }
    std::cout << "Average request duration: "
              << duration_us.count() / line_count << "us." << std::endl;
  }

  return 0;
}
