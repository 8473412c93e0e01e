#pragma once

namespace focusguard {

enum class RuleType {
    Website,
    App,
    Category
};

enum class Strictness {
    Soft,
    Medium,
    Hard
};

enum class ScheduleType {
    Always,
    FocusOnly,
    Scheduled
};

enum class OverallPermissionStatus {
    FullyFunctional,
    Degraded,
    NonFunctional
};

enum class ErrorKind {
    Validation,
    NotFound,
    AlreadyExists,
    PermissionDenied,
    PreconditionFailed,
    SystemError
};

} // namespace focusguard
