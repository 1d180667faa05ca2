#pragma once

#include <stdexcept>
#include <string>

namespace ds::types {

enum class SyncError {
    SourceMissing,
    EmptyCheckFailed,        // I/O error while probing the source for entries
    DestinationCreateFailed,
    ToolInvocationFailed,    // spawn, pipe or exec failure of the mirroring tool
    ExecutionFailed          // nonzero tool exit or copy I/O error
};

std::string to_string(SyncError e);

class SyncException : public std::runtime_error {
public:
    SyncException(const SyncError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] SyncError code() const { return code_; }

private:
    SyncError code_;
};

}
