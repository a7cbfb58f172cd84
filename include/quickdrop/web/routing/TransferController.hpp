#pragma once

#include <memory>

namespace httplib {
class Server;
class Request;
class Response;
class ContentReader;
} // namespace httplib

namespace QD::Web {

struct HttpRequestContext;

// GET /, POST /upload and GET /download/<name>.
class TransferController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<TransferController>;

    void register_routes(httplib::Server& server);

    ~TransferController();

private:
    explicit TransferController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;

    void handle_list_request(httplib::Request const& req, httplib::Response& res);
    void handle_upload_request(httplib::Request const&       req,
                               httplib::Response&            res,
                               httplib::ContentReader const& content_reader);
    void handle_download_request(httplib::Request const& req, httplib::Response& res);
};

} // namespace QD::Web
