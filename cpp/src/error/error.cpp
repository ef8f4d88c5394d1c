// ==============================================================================
// error.cpp - Ошибки разрешения скриптов
// ==============================================================================

#include "verfold/error.hpp"

#include <utility>

namespace verfold {

const char* error_kind_to_string(ResolveErrorKind kind) {
    switch (kind) {
    case ResolveErrorKind::MalformedVersion:
        return "malformed version";
    case ResolveErrorKind::AmbiguousVersion:
        return "ambiguous version";
    case ResolveErrorKind::Io:
        return "io error";
    }
    return "unknown";
}

ResolveError::ResolveError(ResolveErrorKind kind, const std::string& message, std::string subject)
    : std::runtime_error(message), kind_(kind), subject_(std::move(subject)) {}

std::string ResolveError::format() const {
    return std::string(error_kind_to_string(kind_)) + ": " + what();
}

}  // namespace verfold
