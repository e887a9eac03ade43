#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "NRNExtractor.hpp"
#include "NRNFields.hpp"

std::string ReadAllFromStdin() {
  std::ios::sync_with_stdio(false);
  std::ostringstream sstream;
  sstream << std::cin.rdbuf();
  return sstream.str();
}

void PrintUsage() {
  std::cerr << "Usage: ./text-analyzer standard|thorough|paranoid [formatted]"
            << std::endl;
}

// Builds a new NRNExtractor from the supplied string specification.
std::unique_ptr<NRNExtractor> NewExtractorFromSpec(const std::string& spec) {
  NRNExtractor::Mode mode;
  if (!NRNExtractor::ParseMode(spec, &mode)) {
    PrintUsage();
    exit(1);
  }
  return std::make_unique<NRNExtractor>(mode);
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 2 || argc > 3) {
    PrintUsage();
    exit(1);
  }

  bool formatted = false;
  if (argc == 3) {
    if (std::string(argv[2]) != "formatted") {
      PrintUsage();
      exit(1);
    }
    formatted = true;
  }

  // Build extractor from spec and use it to process all text from standard
  // input.
  auto extractor = NewExtractorFromSpec(argv[1]);
  extractor->Process(ReadAllFromStdin());
  for (const std::string& nrn : extractor->Results()) {
    std::cout << (formatted ? NRNFields::ToFormatted(nrn) : nrn) << std::endl;
  }

  return 0;
}
