#include "core/mutation.hpp"

#include "common/logging.hpp"

namespace sysmend {

MutationSource makeDryRunSource(const MutationSource &source)
{
    MutationSource dryRun;
    for (const auto &item : source) {
        const std::string name = item.first;
        MutationOp op;
        op.read = item.second.read;
        op.apply = [name](const nlohmann::json &args) {
            SMLOG_INFO(QStringLiteral("DryRun"),
                       QStringLiteral("apply"),
                       QStringLiteral("mutation_skipped"),
                       QStringLiteral("dry_run"),
                       QStringLiteral("log_only"),
                       sysmend::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"operation", name}, {"args", args}}));
        };
        dryRun.emplace(name, std::move(op));
    }
    return dryRun;
}

} // namespace sysmend
