#pragma once

namespace sysmend {

enum class ActionStatus {
    Success,
    SkippedPrecondition,
    PartialFailure,
    Failure,
    Cancelled
};

enum class SubStepStatus {
    Applied,
    AlreadyApplied,
    Failed
};

enum class PredicateKind {
    Equals,
    NotEquals,
    Present,
    Contains,
    Matches,
    Custom
};

// Which values an emergency restore writes back.
enum class RestoreMode {
    FactoryDefaults,
    PreSession
};

} // namespace sysmend
