#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "BiologicalSex.hpp"
#include "NRNDate.hpp"
#include "NRNGenerator.hpp"

void PrintUsage() {
  std::cerr << "Usage: ./nrn-gen count [male|female] [min_date max_date]"
            << std::endl;
  std::cerr << "Dates are YYYY-MM-DD." << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 5) {
    PrintUsage();
    exit(1);
  }

  int n = atoi(argv[1]);
  if (n < 0) {
    PrintUsage();
    exit(1);
  }

  // Optional sex, then optional date range.
  int next_arg = 2;
  bool has_sex = false;
  BiologicalSex sex = BiologicalSex::kFemale;
  if (next_arg < argc) {
    std::string arg(argv[next_arg]);
    if (arg == "male" || arg == "female") {
      has_sex = true;
      sex = arg == "male" ? BiologicalSex::kMale : BiologicalSex::kFemale;
      ++next_arg;
    }
  }

  bool has_range = false;
  NRNDate min_date = NRNDate{1900, 1, 1}, max_date = NRNDate::Today();
  if (argc - next_arg == 2) {
    if (!NRNDate::Parse(argv[next_arg], &min_date) ||
        !NRNDate::Parse(argv[next_arg + 1], &max_date)) {
      std::cerr << "Could not parse date range \"" << argv[next_arg] << "\" \""
                << argv[next_arg + 1] << "\"." << std::endl;
      PrintUsage();
      exit(1);
    }
    has_range = true;
  } else if (argc != next_arg) {
    PrintUsage();
    exit(1);
  }

  NRNGenerator& generator = NRNGenerator::Shared();
  std::ios::sync_with_stdio(false);
  try {
    while (n--) {
      if (has_range) {
        std::cout << (has_sex ? generator.Generate(min_date, max_date, sex)
                              : generator.Generate(min_date, max_date))
                  << "\n";
      } else {
        std::cout << (has_sex ? generator.Generate(sex) : generator.Generate())
                  << "\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  std::cout.flush();

  return 0;
}
