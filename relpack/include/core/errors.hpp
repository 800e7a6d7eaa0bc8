#pragma once

#include <string>

namespace relpack {

enum class ErrorKind {
    BuildInvocation,
    MissingArtifact,
    EmptyArtifact,
    ArchiveWrite,
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::BuildInvocation:
        return "BuildInvocationError";
    case ErrorKind::MissingArtifact:
        return "MissingArtifactError";
    case ErrorKind::EmptyArtifact:
        return "EmptyArtifactError";
    case ErrorKind::ArchiveWrite:
        return "ArchiveWriteError";
    }
    return "UnknownError";
}

// An empty triple marks a failure that belongs to the whole run.
struct TargetFailure {
    std::string triple;
    ErrorKind kind = ErrorKind::BuildInvocation;
    std::string reason;
    std::string diagnostics;
};

} // namespace relpack
