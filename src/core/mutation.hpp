#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sysmend {

// One OS-mutation primitive. apply throws on failure; read, when present,
// returns the current value of the target named by args (or nullopt if it
// cannot be determined).
struct MutationOp {
    std::function<void(const nlohmann::json &args)> apply;
    std::function<std::optional<nlohmann::json>(const nlohmann::json &args)> read;
};

using MutationSource = std::map<std::string, MutationOp>;

// Wraps every apply with a logged no-op; reads stay live.
MutationSource makeDryRunSource(const MutationSource &source);

} // namespace sysmend
