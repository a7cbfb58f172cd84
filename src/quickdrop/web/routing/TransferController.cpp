#include <quickdrop/web/routing/TransferController.hpp>

#include <quickdrop/transfer/ChunkedFileStream.hpp>
#include <quickdrop/transfer/DownloadPlanner.hpp>
#include <quickdrop/transfer/FileCatalog.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>
#include <quickdrop/transfer/UploadSession.hpp>
#include <quickdrop/web/ListingPage.hpp>
#include <quickdrop/web/Metrics.hpp>
#include <quickdrop/web/TransferOptions.hpp>
#include <quickdrop/web/routing/HttpHelpers.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace QD::Web {

namespace {

using json = nlohmann::json;

// Lives as long as httplib keeps the content provider of one download response.
struct DownloadState {
    Transfer::DownloadJob                      job;
    std::optional<Transfer::ChunkedFileStream> stream;
    std::string                                client;
    bool                                       read_failed{false};
};

void respond_no_files(httplib::Response& res) {
    write_json_response(res, json{{"error", "No files"}}, 400);
}

} // namespace

auto TransferController::Create(HttpRequestContext& ctx) -> std::unique_ptr<TransferController> {
    return std::unique_ptr<TransferController>(new TransferController(ctx));
}

TransferController::TransferController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

TransferController::~TransferController() = default;

void TransferController::register_routes(httplib::Server& server) {
    server.Get("/", [this](httplib::Request const& req, httplib::Response& res) {
        handle_list_request(req, res);
    });

    server.Post("/upload",
                [this](httplib::Request const&       req,
                       httplib::Response&            res,
                       httplib::ContentReader const& content_reader) {
                    handle_upload_request(req, res, content_reader);
                });

    server.Get(R"(/download/(.+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_download_request(req, res);
    });
}

void TransferController::handle_list_request(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::List, res};

    auto files = Transfer::ListSharedFiles(ctx_.folder, [this](QD::Error const& error) {
        ctx_.log_error(std::string{"[quickdrop] Error listing files: "} + QD::describeError(error));
    });

    auto const folder = ctx_.folder.display();
    if (wants_json_response(req)) {
        write_json_response(res, BuildListingJson(folder, files), 200, true);
        return;
    }
    res.status = 200;
    res.set_header("Cache-Control", "no-store");
    res.set_content(BuildListingPage(folder, files), "text/html; charset=utf-8");
}

void TransferController::handle_upload_request(httplib::Request const&       req,
                                               httplib::Response&            res,
                                               httplib::ContentReader const& content_reader) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Upload, res};
    auto const client = get_client_address(req);

    if (!req.is_multipart_form_data()) {
        // Drain the body so the connection stays usable.
        content_reader([](char const*, std::size_t) { return true; });
        respond_no_files(res);
        return;
    }

    Transfer::UploadSession session{ctx_.folder, NamingPolicyFor(ctx_.options)};
    bool const read_all = content_reader(
        [&session](httplib::MultipartFormData const& part) {
            session.begin_part(part.name, part.filename);
            return true;
        },
        [&session](char const* data, std::size_t length) {
            session.write(data, length);
            return true;
        });

    if (!read_all) {
        ctx_.metrics.record_bytes_received(session.bytes_received());
        ctx_.log_error("[quickdrop] Upload from " + client + " interrupted after "
                       + std::to_string(session.bytes_received()) + " bytes");
        respond_bad_request(res, "Upload interrupted");
        return;
    }

    auto result = session.finish();
    ctx_.metrics.record_bytes_received(session.bytes_received());

    for (auto const& failure : result.failed) {
        ctx_.metrics.record_upload_failed();
        ctx_.log_error("[quickdrop] Upload of '" + failure.client_filename + "' from " + client
                       + " failed: " + QD::describeError(failure.error));
    }
    for (auto const& name : result.uploaded) {
        ctx_.metrics.record_upload_stored();
        ctx_.log_info("[quickdrop] Stored " + name + " from " + client);
    }

    if (!result.saw_files_field) {
        respond_no_files(res);
        return;
    }
    write_json_response(res, json{{"uploaded", result.uploaded}}, 200);
}

void TransferController::handle_download_request(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Download, res};

    std::optional<std::string> range_header;
    if (req.has_header("Range")) {
        range_header = req.get_header_value("Range");
    }

    // The planner owns the Range interval. httplib must not slice the response body a second time.
    // The request object handed to handlers is the server's own non-const instance.
    const_cast<httplib::Request&>(req).ranges.clear();

    auto const requested = req.matches[1].str();
    auto plan = Transfer::PlanDownload(requested,
                                       range_header ? std::optional<std::string_view>{*range_header}
                                                    : std::nullopt,
                                       ctx_.folder,
                                       ctx_.options.chunk_size_bytes);
    if (!plan) {
        if (plan.error().code == QD::Error::Code::AccessDenied) {
            ctx_.log_error("[quickdrop] Refused download of '" + requested + "' from "
                           + get_client_address(req) + ": outside the shared folder");
        }
        respond_error(res, plan.error());
        return;
    }

    auto state    = std::make_shared<DownloadState>();
    state->job    = std::move(*plan);
    state->client = get_client_address(req);
    auto const& job = state->job;

    if (!job.satisfiable()) {
        for (auto const& [name, value] : job.headers()) {
            res.set_header(name, value);
        }
        write_json_response(res,
                            json{{"error", "range_not_satisfiable"},
                                 {"message", "Requested range lies outside the file"}},
                            416,
                            true);
        return;
    }

    res.status = job.status();
    for (auto const& [name, value] : job.headers()) {
        // httplib sets both from the content provider.
        if (name == "Content-Length" || name == "Content-Type") {
            continue;
        }
        res.set_header(name, value);
    }

    if (job.range.length() == 0) {
        res.set_content(std::string{}, "application/octet-stream");
        return;
    }

    ctx_.metrics.record_download_started(job.range.is_partial());
    res.set_content_provider(
        static_cast<std::size_t>(job.range.length()),
        "application/octet-stream",
        [this, state](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
            auto&      stream   = state->stream;
            auto const absolute = state->job.range.start + offset;
            if (!stream || stream->position() != absolute) {
                Transfer::RangeSpec window = state->job.range;
                window.start               = absolute;
                window.end                 = absolute + length - 1;
                auto opened = Transfer::ChunkedFileStream::Open(state->job.absolute_path,
                                                                window,
                                                                state->job.chunk_size);
                if (!opened) {
                    state->read_failed = true;
                    ctx_.log_error("[quickdrop] Cannot stream " + state->job.file_name + ": "
                                   + QD::describeError(opened.error()));
                    return false;
                }
                stream.emplace(std::move(*opened));
            }

            auto chunk = stream->next();
            if (!chunk) {
                state->read_failed = true;
                ctx_.log_error("[quickdrop] Short read on " + state->job.file_name + " at offset "
                               + std::to_string(stream->position()));
                return false;
            }
            if (!sink.write(chunk->data(), chunk->size())) {
                return false;
            }
            ctx_.metrics.record_bytes_sent(chunk->size());
            return true;
        },
        [this, state](bool success) {
            std::uint64_t streamed = 0;
            if (state->stream) {
                streamed = state->stream->bytes_streamed();
                state->stream->close();
            }
            bool const completed = success && !state->read_failed;
            ctx_.metrics.record_download_finished(completed);
            if (!completed) {
                ctx_.log_info("[quickdrop] Download of " + state->job.file_name + " by " + state->client
                              + " aborted after " + std::to_string(streamed) + " bytes");
            }
        });
}

} // namespace QD::Web
