#include "core/action_registry.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/precondition.hpp"

namespace sysmend {

namespace {

std::string joinReasons(const std::vector<std::string> &reasons)
{
    std::string out;
    for (const auto &reason : reasons) {
        if (!out.empty()) {
            out += "; ";
        }
        out += reason;
    }
    return out;
}

bool succeeded(const SubStepResult &result)
{
    return result.status != SubStepStatus::Failed;
}

void logActionResult(const QString &where, const ActionResult &result)
{
    const nlohmann::json context{{"actionId", result.actionId},
                                 {"status", toActionStatusString(result.status)},
                                 {"subSteps", result.subStepResults.size()},
                                 {"detail", result.detail}};
    if (result.status == ActionStatus::Failure
        || result.status == ActionStatus::PartialFailure) {
        SMLOG_WARN(QStringLiteral("ActionRegistry"),
                   where,
                   QStringLiteral("action_finished"),
                   QStringLiteral("sub_step_failure"),
                   QStringLiteral("sequential_sub_steps"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   context);
        return;
    }
    SMLOG_INFO(QStringLiteral("ActionRegistry"),
               where,
               QStringLiteral("action_finished"),
               QStringLiteral("user_request"),
               QStringLiteral("sequential_sub_steps"),
               sysmend::logging::defaultWho(),
               QString(),
               context);
}

} // namespace

ActionStatus aggregateStatus(const std::vector<SubStepResult> &results)
{
    size_t ok = 0;
    for (const auto &result : results) {
        if (succeeded(result)) {
            ++ok;
        }
    }
    if (ok == results.size()) {
        return ActionStatus::Success;
    }
    if (ok == 0) {
        return ActionStatus::Failure;
    }
    return ActionStatus::PartialFailure;
}

ActionRegistry::ActionRegistry(MutationSource source, RestoreMode restoreMode)
    : m_source(std::move(source))
    , m_restoreMode(restoreMode)
{
}

void ActionRegistry::registerAction(ActionSpec spec)
{
    for (auto &step : spec.revert) {
        step.restoring = true;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_index.count(spec.id) != 0) {
        throw DuplicateActionError(spec.id);
    }
    m_index[spec.id] = m_actions.size();
    m_actions.push_back(std::move(spec));
}

void ActionRegistry::registerRestoreAction(const std::string &id,
                                           const std::string &description,
                                           const std::vector<std::string> &order)
{
    ActionSpec restore;
    restore.id = id;
    restore.description = description;
    for (const auto &actionId : order) {
        const ActionSpec source = spec(actionId);
        for (const auto &step : source.revert) {
            SubStepSpec composed = step;
            composed.name = actionId + "/" + step.name;
            composed.restoring = true;
            restore.apply.push_back(std::move(composed));
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_index.count(restore.id) != 0) {
        throw DuplicateActionError(restore.id);
    }
    m_index[restore.id] = m_actions.size();
    m_actions.push_back(std::move(restore));
}

bool ActionRegistry::contains(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(id) != 0;
}

ActionSpec ActionRegistry::spec(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_index.find(id);
    if (it == m_index.end()) {
        throw UnknownActionError(id);
    }
    return m_actions[it->second];
}

std::vector<ActionSummary> ActionRegistry::listActions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ActionSummary> summaries;
    summaries.reserve(m_actions.size());
    for (const auto &action : m_actions) {
        summaries.push_back(ActionSummary{action.id, action.description});
    }
    return summaries;
}

RestoreMode ActionRegistry::restoreMode() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_restoreMode;
}

void ActionRegistry::setRestoreMode(RestoreMode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_restoreMode = mode;
}

ActionResult ActionRegistry::execute(const std::string &id, const Snapshot &snapshot,
                                     const CancellationToken *cancel)
{
    const ActionSpec action = spec(id);

    const std::vector<std::string> unmet = unmetPreconditions(action.preconditions, snapshot);
    if (!unmet.empty()) {
        ActionResult result;
        result.actionId = id;
        result.status = ActionStatus::SkippedPrecondition;
        result.detail = joinReasons(unmet);
        SMLOG_INFO(QStringLiteral("ActionRegistry"),
                   QStringLiteral("execute"),
                   QStringLiteral("action_skipped"),
                   QStringLiteral("precondition_unmet"),
                   QStringLiteral("snapshot_predicates"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"actionId", id},
                                   {"snapshotId", snapshot.id()},
                                   {"unmet", unmet}}));
        return result;
    }

    ActionResult result = runSteps(id, action.apply, cancel);
    logActionResult(QStringLiteral("execute"), result);
    return result;
}

BatchResult ActionRegistry::executeBatch(const std::vector<std::string> &ids,
                                         const Snapshot &snapshot,
                                         const CancellationToken *cancel)
{
    for (const auto &id : ids) {
        if (!contains(id)) {
            throw UnknownActionError(id);
        }
    }

    sysmend::logging::CorrelationScope scope(
        QUuid::createUuid().toString(QUuid::WithoutBraces));
    SMLOG_INFO(QStringLiteral("ActionRegistry"),
               QStringLiteral("executeBatch"),
               QStringLiteral("batch_start"),
               QStringLiteral("user_request"),
               QStringLiteral("ordered_actions"),
               sysmend::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"actions", ids}, {"snapshotId", snapshot.id()}}));

    BatchResult batch;
    for (const auto &id : ids) {
        if (batch.cancelled || (cancel && cancel->isCancelled())) {
            batch.cancelled = true;
            ActionResult skipped;
            skipped.actionId = id;
            skipped.status = ActionStatus::Cancelled;
            skipped.detail = "batch cancelled before this action started";
            batch.results.push_back(std::move(skipped));
            continue;
        }
        batch.results.push_back(execute(id, snapshot, cancel));
        if (batch.results.back().status == ActionStatus::Cancelled) {
            batch.cancelled = true;
        }
    }

    if (batch.cancelled) {
        SMLOG_WARN(QStringLiteral("ActionRegistry"),
                   QStringLiteral("executeBatch"),
                   QStringLiteral("batch_cancelled"),
                   QStringLiteral("cancellation_requested"),
                   QStringLiteral("stop_between_actions"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"actions", ids.size()}}));
    }
    return batch;
}

ActionResult ActionRegistry::revert(const std::string &id, const CancellationToken *cancel)
{
    const ActionSpec action = spec(id);
    ActionResult result = runSteps(id, action.revert, cancel);
    logActionResult(QStringLiteral("revert"), result);
    return result;
}

ActionResult ActionRegistry::runSteps(const std::string &actionId,
                                      const std::vector<SubStepSpec> &steps,
                                      const CancellationToken *cancel)
{
    const RestoreMode mode = restoreMode();

    ActionResult result;
    result.actionId = actionId;

    for (size_t i = 0; i < steps.size(); ++i) {
        if (cancel && cancel->isCancelled()) {
            result.status = ActionStatus::Cancelled;
            result.detail = "cancelled after " + std::to_string(i) + " of "
                + std::to_string(steps.size()) + " sub-steps";
            return result;
        }
        result.subStepResults.push_back(runStep(steps[i], mode));
    }

    result.status = aggregateStatus(result.subStepResults);
    return result;
}

SubStepResult ActionRegistry::runStep(const SubStepSpec &step, RestoreMode mode)
{
    SubStepResult result;
    result.name = step.name;
    result.operation = step.operation;

    const auto it = m_source.find(step.operation);
    if (it == m_source.end()) {
        result.status = SubStepStatus::Failed;
        result.detail = "unknown operation '" + step.operation + "'";
        return result;
    }
    const MutationOp &op = it->second;

    // Restore mode only chooses the value written. Steps without a value,
    // and targets this process never changed, run as declared.
    nlohmann::json args = step.args;
    if (step.restoring && mode == RestoreMode::PreSession && args.is_object()
        && args.contains("value")) {
        const auto original = m_journal.original(step.operation, args);
        if (original.has_value()) {
            args["value"] = *original;
        }
    }

    std::optional<nlohmann::json> current;
    if (op.read && args.is_object() && args.contains("value")) {
        try {
            current = op.read(args);
        } catch (const std::exception &ex) {
            SMLOG_DEBUG(QStringLiteral("ActionRegistry"),
                        QStringLiteral("runStep"),
                        QStringLiteral("read_failed"),
                        QStringLiteral("idempotency_check"),
                        QStringLiteral("apply_anyway"),
                        sysmend::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"step", step.name},
                                        {"operation", step.operation},
                                        {"error", ex.what()}}));
            current.reset();
        } catch (...) {
            current.reset();
        }
        if (current.has_value() && *current == args.at("value")) {
            result.status = SubStepStatus::AlreadyApplied;
            result.detail = "already " + current->dump();
            return result;
        }
    }

    try {
        if (!op.apply) {
            throw std::runtime_error("operation has no apply function");
        }
        op.apply(args);
    } catch (const std::exception &ex) {
        result.status = SubStepStatus::Failed;
        result.detail = step.operation + " failed: " + ex.what();
        SMLOG_WARN(QStringLiteral("ActionRegistry"),
                   QStringLiteral("runStep"),
                   QStringLiteral("sub_step_failed"),
                   QStringLiteral("mutation_error"),
                   QStringLiteral("continue_with_next_step"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"step", step.name},
                                   {"operation", step.operation},
                                   {"args", args},
                                   {"error", ex.what()}}));
        return result;
    } catch (...) {
        result.status = SubStepStatus::Failed;
        result.detail = step.operation + " failed: unknown error";
        return result;
    }

    if (!step.restoring && current.has_value()) {
        m_journal.recordOriginal(step.operation, args, *current);
    }

    result.status = SubStepStatus::Applied;
    if (args.is_object() && args.contains("value")) {
        result.detail = "set " + args.at("value").dump();
    }
    return result;
}

} // namespace sysmend
