#include "ddsync/remote/http_service.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace ddsync::remote {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

using content::Fingerprint;
using content::NodeKind;

namespace {

using Response = HttpRemoteService::Response;

bool is_success(int status) { return status >= 200 && status < 300; }

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0f]);
        }
    }
    return encoded;
}

json parent_json(const ParentRef& parent) {
    return json{{"kind", content::to_string(parent.kind)}, {"id", parent.id}};
}

json fingerprint_json(const Fingerprint& fingerprint) {
    return json{{"algorithm", fingerprint.algorithm}, {"value", fingerprint.value}};
}

Result<NodeKind> parse_kind(const std::string& kind) {
    if (kind == "project") return Ok(NodeKind::Project);
    if (kind == "folder") return Ok(NodeKind::Folder);
    if (kind == "file") return Ok(NodeKind::File);
    return Err<NodeKind>(Error::service(0, "unknown node kind '" + kind + "'"));
}

Result<json> parse_body(const std::string& text) {
    json body = json::parse(text, nullptr, false);
    if (body.is_discarded()) {
        return Err<json>(Error::service(0, "malformed JSON in response"));
    }
    return Ok(std::move(body));
}

/// Runs one asynchronous step to completion so stream timeouts apply
template<typename Initiate>
beast::error_code run_step(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

template<typename Stream>
Result<Response> exchange(net::io_context& ioc, Stream& stream,
                          http::request<http::string_body>& request, std::chrono::seconds timeout) {
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::error_code ec = run_step(ioc, [&](auto handler) {
        http::async_write(stream, request, std::move(handler));
    });
    if (ec) {
        return Err<Response>(Error::network("sending request failed: " + ec.message()));
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    beast::get_lowest_layer(stream).expires_after(timeout);
    ec = run_step(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec) {
        return Err<Response>(Error::network("reading response failed: " + ec.message()));
    }

    Response response;
    response.status = static_cast<int>(parser.get().result_int());
    response.body = std::move(parser.get().body());
    return Ok(std::move(response));
}

} // namespace

Result<Endpoint> parse_endpoint(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Endpoint>(Error::validation("service url '" + url + "' has no scheme"));
    }

    Endpoint endpoint;
    endpoint.scheme = lower(url.substr(0, scheme_end));
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        return Err<Endpoint>(Error::validation("unsupported url scheme '" + endpoint.scheme + "'"));
    }

    const std::string rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find('/');
    const std::string authority = rest.substr(0, path_start);
    endpoint.base_path = path_start == std::string::npos ? std::string() : rest.substr(path_start);
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
        endpoint.base_path.pop_back();
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
        if (endpoint.port.empty() ||
            !std::all_of(endpoint.port.begin(), endpoint.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return Err<Endpoint>(Error::validation("invalid port in service url '" + url + "'"));
        }
    } else {
        endpoint.host = authority;
        endpoint.port = endpoint.tls() ? "443" : "80";
    }

    if (endpoint.host.empty()) {
        return Err<Endpoint>(Error::validation("service url '" + url + "' has no host"));
    }
    return Ok(std::move(endpoint));
}

Error error_from_status(int status, const std::string& body) {
    std::string message;
    std::string reason;

    const json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("error") && parsed["error"].is_string()) message = parsed["error"].get<std::string>();
        if (parsed.contains("message") && parsed["message"].is_string()) message = parsed["message"].get<std::string>();
        if (parsed.contains("reason") && parsed["reason"].is_string()) reason = parsed["reason"].get<std::string>();
    }
    if (message.empty()) {
        message = body.empty() ? "HTTP " + std::to_string(status) : body.substr(0, 200);
    }

    switch (status) {
        case 401:
        case 403:
            return Error::auth(message);
        case 404:
            return Error::not_found(message);
        case 400:
        case 409:
        case 422: {
            const std::string haystack = lower(reason + " " + message);
            if (haystack.find("integrity") != std::string::npos ||
                haystack.find("checksum") != std::string::npos ||
                haystack.find("hash mismatch") != std::string::npos) {
                return Error::integrity(message);
            }
            return Error::service(status, message);
        }
        default:
            return Error::service(status, message);
    }
}

Result<std::optional<std::string>> decode_project_lookup(const std::string& body, const std::string& name) {
    auto parsed = parse_body(body);
    if (parsed.is_error()) {
        return Err<std::optional<std::string>>(parsed.error());
    }

    try {
        for (const auto& project : parsed.value().at("results")) {
            if (project.at("name").get<std::string>() == name) {
                return Ok(std::optional<std::string>(project.at("id").get<std::string>()));
            }
        }
    } catch (const json::exception& e) {
        return Err<std::optional<std::string>>(Error::service(0, std::string("unexpected project listing: ") + e.what()));
    }
    return Ok(std::optional<std::string>());
}

Result<std::vector<RemoteEntry>> decode_tree_listing(const std::string& body) {
    auto parsed = parse_body(body);
    if (parsed.is_error()) {
        return Err<std::vector<RemoteEntry>>(parsed.error());
    }

    std::vector<RemoteEntry> entries;
    try {
        for (const auto& item : parsed.value().at("results")) {
            auto kind = parse_kind(item.at("kind").get<std::string>());
            if (kind.is_error()) {
                return Err<std::vector<RemoteEntry>>(kind.error());
            }

            RemoteEntry entry;
            entry.id = item.at("id").get<std::string>();
            entry.parent_id = item.at("parent_id").get<std::string>();
            entry.kind = kind.value();
            entry.name = item.at("name").get<std::string>();
            entry.size = item.value("size", uint64_t{0});

            const auto hash = item.find("hash");
            if (hash != item.end() && !hash->is_null()) {
                if (!hash->is_object()) {
                    return Err<std::vector<RemoteEntry>>(Error::service(0,
                        "hash of '" + entry.name + "' is not an object"));
                }
                Fingerprint fingerprint;
                fingerprint.algorithm = hash->at("algorithm").get<std::string>();
                fingerprint.value = hash->at("value").get<std::string>();
                entry.fingerprint = std::move(fingerprint);
            }
            entries.push_back(std::move(entry));
        }
    } catch (const json::exception& e) {
        return Err<std::vector<RemoteEntry>>(Error::service(0, std::string("unexpected tree listing: ") + e.what()));
    }
    return Ok(std::move(entries));
}

Result<std::unique_ptr<HttpRemoteService>> HttpRemoteService::create(const Config& config) {
    auto endpoint = parse_endpoint(config.url);
    if (endpoint.is_error()) {
        return Err<std::unique_ptr<HttpRemoteService>>(endpoint.error());
    }
    if (config.auth.empty()) {
        return Err<std::unique_ptr<HttpRemoteService>>(
            Error::auth("no credentials configured (set 'auth' or DDSYNC_AUTH)"));
    }
    std::unique_ptr<HttpRemoteService> service(
        new HttpRemoteService(std::move(endpoint.value()), config.auth, config.request_timeout));
    return Ok(std::move(service));
}

HttpRemoteService::HttpRemoteService(Endpoint endpoint, std::string auth, std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)), auth_(std::move(auth)), timeout_(timeout) {}

Result<Response> HttpRemoteService::perform(http::verb verb, const std::string& target, std::string body,
                                            const std::string& content_type, const Headers& headers) const {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    const auto endpoints = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        return Err<Response>(Error::network("cannot resolve " + endpoint_.host + ": " + ec.message()));
    }

    http::request<http::string_body> request{verb, endpoint_.base_path + target, 11};
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, "ddsync");
    request.set(http::field::accept, "application/json");
    request.set(http::field::authorization, "Bearer " + auth_);
    if (!content_type.empty()) {
        request.set(http::field::content_type, content_type);
    }
    for (const auto& [name, value] : headers) {
        request.set(name, value);
    }
    request.body() = std::move(body);
    request.prepare_payload();

    spdlog::debug("HTTP {} {}", std::string(http::to_string(verb)), std::string(request.target()));

    if (!endpoint_.tls()) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout_);
        ec = run_step(ioc, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
        if (ec) {
            return Err<Response>(Error::network("cannot connect to " + endpoint_.host + ": " + ec.message()));
        }

        auto response = exchange(ioc, stream, request, timeout_);

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            spdlog::debug("Socket shutdown: {}", ec.message());
        }
        return response;
    }

    ssl::context tls(ssl::context::tls_client);
    tls.set_default_verify_paths();
    tls.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        return Err<Response>(Error::network("cannot set TLS server name for " + endpoint_.host));
    }
    stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));

    beast::get_lowest_layer(stream).expires_after(timeout_);
    ec = run_step(ioc, [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
    });
    if (ec) {
        return Err<Response>(Error::network("cannot connect to " + endpoint_.host + ": " + ec.message()));
    }

    beast::get_lowest_layer(stream).expires_after(timeout_);
    ec = run_step(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });
    if (ec) {
        return Err<Response>(Error::network("TLS handshake with " + endpoint_.host + " failed: " + ec.message()));
    }

    auto response = exchange(ioc, stream, request, timeout_);

    beast::get_lowest_layer(stream).expires_after(timeout_);
    ec = run_step(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("TLS shutdown: {}", ec.message());
    }
    return response;
}

Result<std::string> HttpRemoteService::request_id(http::verb verb, const std::string& target,
                                                  const std::string& json_body) const {
    auto response = perform(verb, target, json_body, "application/json");
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    if (!is_success(response.value().status)) {
        return Err<std::string>(error_from_status(response.value().status, response.value().body));
    }

    auto body = parse_body(response.value().body);
    if (body.is_error()) {
        return Err<std::string>(body.error());
    }
    const json& parsed = body.value();
    if (!parsed.is_object() || !parsed.contains("id") || !parsed["id"].is_string()) {
        return Err<std::string>(Error::service(response.value().status, "response carries no id"));
    }
    return Ok(parsed["id"].get<std::string>());
}

Result<std::optional<std::string>> HttpRemoteService::find_project(const std::string& name) {
    auto response = perform(http::verb::get, "/projects?name=" + url_encode(name), {}, {});
    if (response.is_error()) {
        return Err<std::optional<std::string>>(response.error());
    }
    if (!is_success(response.value().status)) {
        return Err<std::optional<std::string>>(error_from_status(response.value().status, response.value().body));
    }

    return decode_project_lookup(response.value().body, name);
}

Result<std::string> HttpRemoteService::create_project(const std::string& name) {
    return request_id(http::verb::post, "/projects", json{{"name", name}}.dump());
}

Result<std::string> HttpRemoteService::create_folder(const ParentRef& parent, const std::string& name) {
    return request_id(http::verb::post, "/folders", json{{"name", name}, {"parent", parent_json(parent)}}.dump());
}

Result<std::string> HttpRemoteService::initiate_upload(const UploadRequest& request) {
    const json body{
        {"name", request.name},
        {"parent", parent_json(request.parent)},
        {"size", request.size},
        {"chunk_count", request.chunk_count},
        {"hash", fingerprint_json(request.fingerprint)}
    };
    return request_id(http::verb::post, "/projects/" + url_encode(request.project_id) + "/uploads", body.dump());
}

Result<void> HttpRemoteService::upload_chunk(const std::string& upload_id, uint64_t number,
                                             const std::vector<uint8_t>& data,
                                             const Fingerprint& chunk_fingerprint) {
    const Headers headers{{"X-Content-Hash", chunk_fingerprint.to_string()}};
    auto response = perform(http::verb::put,
        "/uploads/" + url_encode(upload_id) + "/chunks/" + std::to_string(number),
        std::string(data.begin(), data.end()), "application/octet-stream", headers);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!is_success(response.value().status)) {
        return Err<void>(error_from_status(response.value().status, response.value().body));
    }
    return Ok();
}

Result<std::string> HttpRemoteService::finalize_upload(const std::string& upload_id, const ParentRef& parent,
                                                       const Fingerprint& fingerprint,
                                                       const std::optional<std::string>& replaces) {
    json body{{"parent", parent_json(parent)}, {"hash", fingerprint_json(fingerprint)}};
    body["replaces"] = replaces ? json(*replaces) : json(nullptr);
    return request_id(http::verb::put, "/uploads/" + url_encode(upload_id) + "/complete", body.dump());
}

Result<std::vector<RemoteEntry>> HttpRemoteService::list_project_tree(const std::string& project_id) {
    auto response = perform(http::verb::get, "/projects/" + url_encode(project_id) + "/tree", {}, {});
    if (response.is_error()) {
        return Err<std::vector<RemoteEntry>>(response.error());
    }
    if (!is_success(response.value().status)) {
        return Err<std::vector<RemoteEntry>>(error_from_status(response.value().status, response.value().body));
    }

    return decode_tree_listing(response.value().body);
}

Result<std::vector<uint8_t>> HttpRemoteService::fetch_range(const std::string& file_id, uint64_t offset,
                                                            uint64_t length) {
    if (length == 0) {
        return Ok(std::vector<uint8_t>());
    }
    const Headers headers{{"Range", "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1)}};
    auto response = perform(http::verb::get, "/files/" + url_encode(file_id) + "/content", {}, {}, headers);
    if (response.is_error()) {
        return Err<std::vector<uint8_t>>(response.error());
    }
    if (!is_success(response.value().status)) {
        return Err<std::vector<uint8_t>>(error_from_status(response.value().status, response.value().body));
    }
    const std::string& bytes = response.value().body;
    return Ok(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

} // namespace ddsync::remote
