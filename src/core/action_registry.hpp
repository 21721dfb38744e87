#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "core/cancellation.hpp"
#include "core/mutation.hpp"
#include "core/session_journal.hpp"

namespace sysmend {

/**
 * ActionRegistry holds the declarative action table and runs actions
 * against a snapshot through the injected mutation source.
 *
 * Sub-steps run sequentially and a failing step never stops the ones after
 * it. Every failure is captured in the returned result; only programming
 * errors (duplicate or unknown ids) are thrown.
 */
class ActionRegistry
{
public:
    explicit ActionRegistry(MutationSource source,
                            RestoreMode restoreMode = RestoreMode::PreSession);

    // Throws DuplicateActionError when the id is taken.
    void registerAction(ActionSpec spec);

    // Registers a pseudo-action whose apply runs the revert steps of the
    // listed actions in exactly the given order.
    void registerRestoreAction(const std::string &id, const std::string &description,
                               const std::vector<std::string> &order);

    bool contains(const std::string &id) const;
    ActionSpec spec(const std::string &id) const;
    std::vector<ActionSummary> listActions() const;

    ActionResult execute(const std::string &id, const Snapshot &snapshot,
                         const CancellationToken *cancel = nullptr);
    BatchResult executeBatch(const std::vector<std::string> &ids, const Snapshot &snapshot,
                             const CancellationToken *cancel = nullptr);
    ActionResult revert(const std::string &id, const CancellationToken *cancel = nullptr);

    RestoreMode restoreMode() const;
    void setRestoreMode(RestoreMode mode);

    const SessionJournal &journal() const { return m_journal; }

private:
    ActionResult runSteps(const std::string &actionId, const std::vector<SubStepSpec> &steps,
                          const CancellationToken *cancel);
    SubStepResult runStep(const SubStepSpec &step, RestoreMode mode);

    MutationSource m_source;
    SessionJournal m_journal;

    mutable std::mutex m_mutex;
    RestoreMode m_restoreMode;
    std::vector<ActionSpec> m_actions;
    std::map<std::string, size_t> m_index;
};

ActionStatus aggregateStatus(const std::vector<SubStepResult> &results);

} // namespace sysmend
