#include "ddsync/sync/types.hpp"

namespace ddsync::sync {

const char* to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Upload: return "upload";
        case Direction::Download: return "download";
    }
    return "unknown";
}

const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::CreateContainer: return "create-container";
        case OperationKind::UploadFile: return "upload-file";
        case OperationKind::Skip: return "skip";
        case OperationKind::FetchContainer: return "fetch-container";
        case OperationKind::FetchFile: return "fetch-file";
    }
    return "unknown";
}

bool is_transfer(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::UploadFile:
        case OperationKind::FetchFile:
            return true;
        case OperationKind::CreateContainer:
        case OperationKind::Skip:
        case OperationKind::FetchContainer:
            return false;
    }
    return false;
}

} // namespace ddsync::sync
