#pragma once

#include "ddsync/core/config.hpp"
#include "ddsync/remote/service.hpp"

#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ddsync::remote {

struct Endpoint {
    std::string scheme;    ///< "http" or "https"
    std::string host;
    std::string port;
    std::string base_path; ///< Without trailing slash, may be empty

    bool tls() const { return scheme == "https"; }
};

/// Splits "https://host[:port]/base" into its parts
Result<Endpoint> parse_endpoint(const std::string& url);

/**
 * @brief Maps a non-2xx response to the error taxonomy
 *
 * 401/403 -> Auth, 404 -> NotFound, 400/409/422 whose body names an
 * integrity reason -> Integrity, everything else -> Service with the status.
 */
Error error_from_status(int status, const std::string& body);

/// Project id from a "/projects?name=" body, std::nullopt when no entry has that name
Result<std::optional<std::string>> decode_project_lookup(const std::string& body, const std::string& name);

/**
 * @brief Entries of a "/projects/{id}/tree" body
 *
 * A file without "hash" (or with a null one) has no fingerprint. Malformed
 * JSON, missing or mistyped fields and unknown kinds are Service errors.
 */
Result<std::vector<RemoteEntry>> decode_tree_listing(const std::string& body);

/**
 * @brief RemoteService over HTTP(S) with JSON payloads
 *
 * Each call opens its own connection, so any number of workers may call in
 * parallel without sharing a stream. Socket failures and timeouts surface as
 * Network errors.
 */
class HttpRemoteService : public RemoteService {
public:
    static Result<std::unique_ptr<HttpRemoteService>> create(const Config& config);

    Result<std::optional<std::string>> find_project(const std::string& name) override;
    Result<std::string> create_project(const std::string& name) override;
    Result<std::string> create_folder(const ParentRef& parent, const std::string& name) override;
    Result<std::string> initiate_upload(const UploadRequest& request) override;
    Result<void> upload_chunk(const std::string& upload_id, uint64_t number,
                              const std::vector<uint8_t>& data,
                              const content::Fingerprint& chunk_fingerprint) override;
    Result<std::string> finalize_upload(const std::string& upload_id, const ParentRef& parent,
                                        const content::Fingerprint& fingerprint,
                                        const std::optional<std::string>& replaces) override;
    Result<std::vector<RemoteEntry>> list_project_tree(const std::string& project_id) override;
    Result<std::vector<uint8_t>> fetch_range(const std::string& file_id, uint64_t offset,
                                             uint64_t length) override;

    struct Response {
        int status = 0;
        std::string body;
    };

    using Headers = std::vector<std::pair<std::string, std::string>>;

private:
    HttpRemoteService(Endpoint endpoint, std::string auth, std::chrono::seconds timeout);

    Result<Response> perform(boost::beast::http::verb verb, const std::string& target,
                             std::string body, const std::string& content_type,
                             const Headers& headers = {}) const;

    /// perform() plus status check and JSON "id" extraction
    Result<std::string> request_id(boost::beast::http::verb verb, const std::string& target,
                                   const std::string& json_body) const;

    Endpoint endpoint_;
    std::string auth_;
    std::chrono::seconds timeout_;
};

} // namespace ddsync::remote
