#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "core/action_registry.hpp"
#include "core/cancellation.hpp"
#include "core/fact_prober.hpp"

namespace sysmend {

class SysmendCli
{
public:
    // Uses the Linux fact and mutation sources.
    SysmendCli();
    // Injects the collaborators, used by tests.
    SysmendCli(FactSource facts, std::vector<DerivedFact> derived, MutationSource mutations);
    ~SysmendCli();

    // returns exit code
    int run(int argc, char *argv[]);

    CancellationToken &cancellationToken() { return m_cancel; }

private:
    int runFacts(const QStringList &args);
    int runActions(const QStringList &args);
    int runExecute(const QStringList &args);
    int runRevert(const QStringList &args);
    int runRestore(const QStringList &args);

    // Loads config and catalog and builds the prober and registry.
    bool prepare(const QStringList &args, bool needsRegistry);
    SnapshotPtr currentSnapshot();

    std::optional<FactSource> m_factOverride;
    std::vector<DerivedFact> m_derivedOverride;
    std::optional<MutationSource> m_mutationOverride;

    SysmendConfig m_config;
    std::string m_restoreId;
    std::unique_ptr<FactProber> m_prober;
    std::unique_ptr<ActionRegistry> m_registry;
    CancellationToken m_cancel;
};

} // namespace sysmend
