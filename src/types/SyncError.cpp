#include "types/SyncError.hpp"

std::string ds::types::to_string(const SyncError e) {
    switch (e) {
        case SyncError::SourceMissing: return "SourceMissing";
        case SyncError::EmptyCheckFailed: return "EmptyCheckFailed";
        case SyncError::DestinationCreateFailed: return "DestinationCreateFailed";
        case SyncError::ToolInvocationFailed: return "ToolInvocationFailed";
        case SyncError::ExecutionFailed: return "ExecutionFailed";
    }
    return "Unknown";
}
