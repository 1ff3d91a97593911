#pragma once

#include "ddsync/content/node.hpp"
#include "ddsync/remote/service.hpp"

#include <string>

namespace ddsync::remote {

/**
 * @brief Turns the flat project listing into a Content Node tree
 *
 * The returned tree carries remote ids on every node and the reported size
 * and fingerprint on every file. A null tree means the project does not
 * exist yet. Entries that cannot be attached under the project (unknown
 * parent, duplicate id, duplicate sibling name) are Service errors.
 */
class RemoteTreeFetcher {
public:
    explicit RemoteTreeFetcher(RemoteService& service) : service_(service) {}

    Result<content::NodePtr> fetch(const std::string& project_name) const;

private:
    RemoteService& service_;
};

} // namespace ddsync::remote
