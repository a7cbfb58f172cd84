#include <quickdrop/web/routing/HttpHelpers.hpp>

#include <quickdrop/transfer/FileCatalog.hpp>

#include <httplib.h>

namespace QD::Web {

auto get_client_address(httplib::Request const& req) -> std::string {
    if (!req.remote_addr.empty()) {
        return req.remote_addr;
    }
    if (!req.get_header_value("X-Forwarded-For").empty()) {
        return req.get_header_value("X-Forwarded-For");
    }
    return "<unknown>";
}

auto wants_json_response(httplib::Request const& req) -> bool {
    if (req.has_param("format")) {
        return req.get_param_value("format") == "json";
    }
    auto accept = req.get_header_value("Accept");
    return accept.find("application/json") != std::string::npos;
}

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store) {
    res.status = status;
    // Stored names are filtered to ASCII, but listings echo whatever is on disk.
    res.set_content(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "bad_request"},
                                       {"message", message}},
                        400,
                        true);
}

void respond_forbidden(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "forbidden"},
                                       {"message", message}},
                        403,
                        true);
}

void respond_not_found(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "not_found"},
                                       {"message", message}},
                        404,
                        true);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        nlohmann::json{{"error", "internal"},
                                       {"message", message}},
                        500);
}

void respond_payload_too_large(httplib::Response& res, std::uint64_t limit_bytes) {
    write_json_response(res,
                        nlohmann::json{{"error", "payload_too_large"},
                                       {"message", "Request body exceeds "
                                                       + Transfer::FormatFileSize(limit_bytes) + " limit"}},
                        413,
                        true);
}

void respond_error(httplib::Response& res, QD::Error const& error) {
    switch (httpStatusForError(error)) {
    case 400:
        respond_bad_request(res, "Invalid filename");
        return;
    case 403:
        respond_forbidden(res, "Access denied");
        return;
    case 404:
        respond_not_found(res, "File not found");
        return;
    default:
        respond_server_error(res, QD::describeError(error));
        return;
    }
}

} // namespace QD::Web
