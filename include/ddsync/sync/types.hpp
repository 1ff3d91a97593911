#pragma once

namespace ddsync::sync {

enum class Direction {
    Upload,
    Download
};

/**
 * @brief What the transfer layer does for one planned node
 *
 * CreateContainer/UploadFile belong to uploads, FetchContainer/FetchFile to
 * downloads. Skip appears in both: the node already matches on the far side.
 */
enum class OperationKind {
    CreateContainer,
    UploadFile,
    Skip,
    FetchContainer,
    FetchFile
};

const char* to_string(Direction direction) noexcept;
const char* to_string(OperationKind kind) noexcept;

/// True for operations that move file bytes
bool is_transfer(OperationKind kind) noexcept;

} // namespace ddsync::sync
