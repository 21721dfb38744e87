#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace sysmend {

// Evaluates one precondition. A missing, failed or absent fact never
// satisfies anything but a Custom predicate that chooses to accept it.
bool evaluatePrecondition(const Precondition &precondition, const Snapshot &snapshot,
                          std::string *reason);

// Returns one human-readable reason per unmet precondition.
std::vector<std::string> unmetPreconditions(const std::vector<Precondition> &preconditions,
                                            const Snapshot &snapshot);

std::string describePrecondition(const Precondition &precondition);

Precondition makePrecondition(std::string factKey, PredicateKind kind,
                              nlohmann::json expected = nlohmann::json());

} // namespace sysmend
