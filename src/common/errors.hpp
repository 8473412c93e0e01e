#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "common/enums.hpp"

namespace focusguard {

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::AlreadyExists:
        return "already_exists";
    case ErrorKind::PermissionDenied:
        return "permission_denied";
    case ErrorKind::PreconditionFailed:
        return "precondition_failed";
    case ErrorKind::SystemError:
        return "system_error";
    }
    return "system_error";
}

// BlockingError is thrown by every engine operation that refuses a request.
// Validation errors also name the offending field.
class BlockingError : public std::runtime_error
{
public:
    BlockingError(ErrorKind kind, const std::string &message, std::string field = {})
        : std::runtime_error(message)
        , m_kind(kind)
        , m_field(std::move(field))
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

    const std::string &field() const
    {
        return m_field;
    }

    static BlockingError validation(const std::string &field, const std::string &message)
    {
        return BlockingError(ErrorKind::Validation, message, field);
    }

    static BlockingError notFound(const std::string &ruleId)
    {
        return BlockingError(ErrorKind::NotFound, "Rule not found: " + ruleId);
    }

    static BlockingError alreadyExists(const std::string &target)
    {
        return BlockingError(ErrorKind::AlreadyExists, "Rule already exists for target: " + target);
    }

    static BlockingError permissionDenied(const std::string &message)
    {
        return BlockingError(ErrorKind::PermissionDenied, message);
    }

    static BlockingError preconditionFailed(const std::string &message)
    {
        return BlockingError(ErrorKind::PreconditionFailed, message);
    }

    static BlockingError systemError(const std::string &message)
    {
        return BlockingError(ErrorKind::SystemError, message);
    }

private:
    ErrorKind m_kind;
    std::string m_field;
};

} // namespace focusguard
