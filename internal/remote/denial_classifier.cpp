#include "denial_classifier.hpp"

#include <utility>

namespace edgerun::remote {

DenialClassifier SubstringDenialClassifier(std::string pattern) {
  if (pattern.empty()) {
    return [](const std::string&) { return false; };
  }
  return [pattern = std::move(pattern)](const std::string& output) { return output.find(pattern) != std::string::npos; };
}

} // namespace edgerun::remote
