#pragma once

#include <quickdrop/core/Error.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace QD::Transfer {
class SharedFolder;
}

namespace QD::Web {

struct TransferOptions;
class MetricsCollector;

struct HttpRequestContext {
    Transfer::SharedFolder const&         folder;
    TransferOptions const&                options;
    MetricsCollector&                     metrics;
    std::function<void(std::string_view)> log_info;
    std::function<void(std::string_view)> log_error;
};

auto get_client_address(httplib::Request const& req) -> std::string;

// `?format=json`, or an Accept header that names application/json.
auto wants_json_response(httplib::Request const& req) -> bool;

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store = false);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_forbidden(httplib::Response& res, std::string_view message);
void respond_not_found(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res, std::uint64_t limit_bytes);

// Status and body derived from httpStatusForError().
void respond_error(httplib::Response& res, QD::Error const& error);

} // namespace QD::Web
