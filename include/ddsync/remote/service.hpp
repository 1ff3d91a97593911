/**
 * @file service.hpp
 * @brief Contract of the remote hierarchical object store
 *
 * The sync engine only talks to the remote side through this interface.
 * HttpRemoteService implements it over the network; tests use an in-memory
 * implementation with fault injection.
 *
 * Every operation may be called concurrently from transfer workers, so
 * implementations must be thread-safe.
 */

#pragma once

#include "ddsync/content/fingerprint.hpp"
#include "ddsync/content/node.hpp"
#include "ddsync/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ddsync::remote {

/// A container on the remote side that new nodes are created under
struct ParentRef {
    content::NodeKind kind = content::NodeKind::Project;
    std::string id;
};

/// One node of a project listing; parent_id of top-level nodes is the project id
struct RemoteEntry {
    std::string id;
    std::string parent_id;
    content::NodeKind kind = content::NodeKind::File;
    std::string name;
    uint64_t size = 0;
    std::optional<content::Fingerprint> fingerprint;
};

struct UploadRequest {
    std::string project_id;
    ParentRef parent;
    std::string name;
    uint64_t size = 0;
    uint64_t chunk_count = 0;
    content::Fingerprint fingerprint;
};

class RemoteService {
public:
    virtual ~RemoteService() = default;

    /// Project id by name, std::nullopt when no such project exists
    virtual Result<std::optional<std::string>> find_project(const std::string& name) = 0;

    virtual Result<std::string> create_project(const std::string& name) = 0;

    virtual Result<std::string> create_folder(const ParentRef& parent, const std::string& name) = 0;

    /// Declares a file upload and returns its upload id
    virtual Result<std::string> initiate_upload(const UploadRequest& request) = 0;

    /// Chunk numbers are explicit and zero-based; arrival order does not matter
    virtual Result<void> upload_chunk(const std::string& upload_id, uint64_t number,
                                      const std::vector<uint8_t>& data,
                                      const content::Fingerprint& chunk_fingerprint) = 0;

    /**
     * @brief Completes an upload once every chunk was acknowledged
     *
     * The service checks the assembled content against the fingerprint and
     * answers with an Integrity error on mismatch. When replaces holds the id
     * of an existing file, the new content is stored under that id.
     *
     * @return Remote id of the file
     */
    virtual Result<std::string> finalize_upload(const std::string& upload_id, const ParentRef& parent,
                                                const content::Fingerprint& fingerprint,
                                                const std::optional<std::string>& replaces) = 0;

    /// Every folder and file below the project, in no particular order
    virtual Result<std::vector<RemoteEntry>> list_project_tree(const std::string& project_id) = 0;

    virtual Result<std::vector<uint8_t>> fetch_range(const std::string& file_id, uint64_t offset,
                                                     uint64_t length) = 0;
};

} // namespace ddsync::remote
