#pragma once

#include <functional>
#include <string>

namespace edgerun::remote {

inline constexpr char kDefaultPolicyDenialPattern[] = "policy does not permit";

// Decides from a failed primary attempt's combined output whether the overlay's
// access policy (and not reachability) rejected it.
using DenialClassifier = std::function<bool(const std::string& output)>;

DenialClassifier SubstringDenialClassifier(std::string pattern = kDefaultPolicyDenialPattern);

} // namespace edgerun::remote
