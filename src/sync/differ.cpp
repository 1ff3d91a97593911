#include "ddsync/sync/differ.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ddsync::sync {

using content::ContentNode;
using content::NodeKind;

namespace {

PlannedOperation describe(const ContentNode& node, OperationKind kind, size_t parent) {
    PlannedOperation op;
    op.kind = kind;
    op.node_kind = node.kind();
    op.path = node.path();
    op.display_path = node.display_path();
    op.name = node.name();
    op.parent = parent;
    op.size = node.size();
    return op;
}

Error kind_mismatch(const ContentNode& local, const ContentNode& remote) {
    return Error::validation("'" + local.display_path() + "' is a " + content::to_string(local.kind()) +
                             " locally but a " + content::to_string(remote.kind()) + " remotely");
}

} // namespace

Result<OperationPlan> Differ::plan_upload(const ContentNode& local, const ContentNode* remote) const {
    if (local.kind() != NodeKind::Project) {
        return Err<OperationPlan>(Error::validation("upload plan must start at a project"));
    }
    if (remote && remote->kind() != NodeKind::Project) {
        return Err<OperationPlan>(Error::validation("remote tree must start at a project"));
    }

    OperationPlan plan;
    plan.direction = Direction::Upload;
    plan.project_name = local.name();

    PlannedOperation root = describe(local, remote ? OperationKind::Skip : OperationKind::CreateContainer, kNoParent);
    if (remote) {
        root.remote_id = remote->remote_id();
    }
    root.local_path = local.local_path();
    plan.operations.push_back(std::move(root));

    auto children = plan_upload_children(local, remote, 0, plan);
    if (children.is_error()) {
        return Err<OperationPlan>(children.error());
    }

    spdlog::debug("Upload plan for '{}': {} create, {} upload, {} skip",
        plan.project_name, plan.count(OperationKind::CreateContainer),
        plan.count(OperationKind::UploadFile), plan.count(OperationKind::Skip));
    return Ok(std::move(plan));
}

Result<void> Differ::plan_upload_children(const ContentNode& local, const ContentNode* remote,
                                          size_t parent, OperationPlan& plan) const {
    for (const auto& child : local.children()) {
        const ContentNode* remote_child = remote ? remote->child(child->name()) : nullptr;
        if (remote_child && remote_child->kind() != child->kind()) {
            return Err<void>(kind_mismatch(*child, *remote_child));
        }

        switch (child->kind()) {
            case NodeKind::Project:
                return Err<void>(Error::validation("nested project at '" + child->display_path() + "'"));

            case NodeKind::Folder: {
                PlannedOperation op = describe(*child,
                    remote_child ? OperationKind::Skip : OperationKind::CreateContainer, parent);
                op.local_path = child->local_path();
                if (remote_child) {
                    op.remote_id = remote_child->remote_id();
                }
                plan.operations.push_back(std::move(op));

                auto nested = plan_upload_children(*child, remote_child, plan.operations.size() - 1, plan);
                if (nested.is_error()) {
                    return nested;
                }
                break;
            }

            case NodeKind::File: {
                auto fingerprint = child->fingerprint();
                if (fingerprint.is_error()) {
                    return Err<void>(fingerprint.error());
                }

                OperationKind kind = OperationKind::UploadFile;
                if (remote_child) {
                    const auto remote_fingerprint = remote_child->known_fingerprint();
                    if (remote_fingerprint && *remote_fingerprint == fingerprint.value()) {
                        if (remote_child->size() == child->size()) {
                            kind = OperationKind::Skip;
                        } else {
                            spdlog::warn("Fingerprint collision on '{}': {} matches but local size {} != remote size {}, uploading",
                                child->display_path(), fingerprint.value().to_string(),
                                child->size(), remote_child->size());
                        }
                    }
                }

                PlannedOperation op = describe(*child, kind, parent);
                op.fingerprint = fingerprint.value();
                op.local_path = child->local_path();
                if (remote_child) {
                    op.remote_id = remote_child->remote_id();
                }
                if (kind == OperationKind::UploadFile) {
                    op.chunk_count = chunk_count(op.size, config_.upload_bytes_per_chunk);
                }
                plan.operations.push_back(std::move(op));
                break;
            }
        }
    }
    return Ok();
}

Result<OperationPlan> Differ::plan_download(const ContentNode& remote, const ContentNode* local,
                                            const fs::path& destination,
                                            const content::PathFilter* filter) const {
    if (remote.kind() != NodeKind::Project) {
        return Err<OperationPlan>(Error::validation("download plan must start at a project"));
    }

    OperationPlan plan;
    plan.direction = Direction::Download;
    plan.project_name = remote.name();

    PlannedOperation root = describe(remote, local ? OperationKind::Skip : OperationKind::FetchContainer, kNoParent);
    root.remote_id = remote.remote_id();
    root.local_path = destination;
    plan.operations.push_back(std::move(root));

    auto children = plan_download_children(remote, local, 0, destination, filter, plan);
    if (children.is_error()) {
        return Err<OperationPlan>(children.error());
    }

    if (local) {
        Result<void> leftovers = Ok();
        content::walk(*local, [&](const ContentNode& node, const ContentNode*) {
            if (leftovers.is_error() || node.kind() == NodeKind::Project) {
                return;
            }
            if (!remote.find(node.path())) {
                leftovers = Err<void>(Error::validation(
                    "destination " + destination.string() + " holds '" + node.display_path() +
                    "' which is not part of project '" + remote.name() + "'"));
            }
        });
        if (leftovers.is_error()) {
            return Err<OperationPlan>(leftovers.error());
        }
    }

    if (filter) {
        for (const auto& unused : filter->unused_paths()) {
            spdlog::warn("Path '{}' did not match anything in project '{}'", unused, remote.name());
        }
    }

    spdlog::debug("Download plan for '{}': {} folder(s), {} file(s), {} skip",
        plan.project_name, plan.count(OperationKind::FetchContainer),
        plan.count(OperationKind::FetchFile), plan.count(OperationKind::Skip));
    return Ok(std::move(plan));
}

Result<void> Differ::plan_download_children(const ContentNode& remote, const ContentNode* local,
                                            size_t parent, const fs::path& destination,
                                            const content::PathFilter* filter, OperationPlan& plan) const {
    for (const auto& child : remote.children()) {
        if (filter && !filter->accepts(child->path_string())) {
            continue;
        }

        const ContentNode* local_child = local ? local->child(child->name()) : nullptr;
        if (local_child && local_child->kind() != child->kind()) {
            return Err<void>(kind_mismatch(*local_child, *child));
        }

        const fs::path target = destination / fs::path(child->path_string());

        switch (child->kind()) {
            case NodeKind::Project:
                return Err<void>(Error::validation("nested project at '" + child->display_path() + "'"));

            case NodeKind::Folder: {
                PlannedOperation op = describe(*child,
                    local_child ? OperationKind::Skip : OperationKind::FetchContainer, parent);
                op.remote_id = child->remote_id();
                op.local_path = target;
                plan.operations.push_back(std::move(op));

                auto nested = plan_download_children(*child, local_child, plan.operations.size() - 1,
                                                     destination, filter, plan);
                if (nested.is_error()) {
                    return nested;
                }
                break;
            }

            case NodeKind::File: {
                const auto remote_fingerprint = child->known_fingerprint();
                if (!remote_fingerprint) {
                    return Err<void>(Error::service(0, "remote file '" + child->display_path() + "' has no fingerprint"));
                }

                OperationKind kind = OperationKind::FetchFile;
                if (local_child) {
                    auto local_fingerprint = local_child->fingerprint();
                    if (local_fingerprint.is_error()) {
                        return Err<void>(local_fingerprint.error());
                    }
                    if (local_fingerprint.value() != *remote_fingerprint || local_child->size() != child->size()) {
                        return Err<void>(Error::validation(
                            "destination file " + target.string() + " differs from the remote content"));
                    }
                    kind = OperationKind::Skip;
                }

                PlannedOperation op = describe(*child, kind, parent);
                op.remote_id = child->remote_id();
                op.fingerprint = remote_fingerprint;
                op.local_path = target;
                if (kind == OperationKind::FetchFile) {
                    op.chunk_count = chunk_count(op.size, config_.download_bytes_per_chunk);
                }
                plan.operations.push_back(std::move(op));
                break;
            }
        }
    }
    return Ok();
}

} // namespace ddsync::sync
