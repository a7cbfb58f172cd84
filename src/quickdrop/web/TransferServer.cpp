#include <quickdrop/web/TransferServer.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>
#include <quickdrop/web/Metrics.hpp>
#include <quickdrop/web/routing/HttpHelpers.hpp>
#include <quickdrop/web/routing/TransferController.hpp>

#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace QD::Web {

static std::atomic<bool> g_should_stop{false};

void RequestTransferStop() {
    g_should_stop.store(true);
}

void ResetTransferStopFlag() {
    g_should_stop.store(false);
}

int RunTransferServerWithStopFlag(TransferOptions const&                 options,
                                  std::atomic<bool>&                     should_stop,
                                  TransferLogHooks const&                log_hooks,
                                  std::function<void(QD::Expected<int>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](QD::Expected<int> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    if (auto invalid = ValidateTransferOptions(options)) {
        log_error("[quickdrop] " + *invalid);
        report_listen_status(std::unexpected(QD::Error{QD::Error::Code::MalformedInput, *invalid}));
        return EXIT_FAILURE;
    }

    auto folder = Transfer::SharedFolder::Open(options.shared_folder);
    if (!folder) {
        log_error("[quickdrop] Cannot use shared folder: " + QD::describeError(folder.error()));
        report_listen_status(std::unexpected(folder.error()));
        return EXIT_FAILURE;
    }

    MetricsCollector metrics;

    HttpRequestContext http_context{
        .folder    = *folder,
        .options   = options,
        .metrics   = metrics,
        .log_info  = log_info,
        .log_error = log_error,
    };

    httplib::Server server;

    auto const worker_threads = static_cast<std::size_t>(options.worker_threads);
    server.new_task_queue = [worker_threads] { return new httplib::ThreadPool(worker_threads); };
    server.set_payload_max_length(static_cast<std::size_t>(options.max_upload_bytes));
    server.set_read_timeout(static_cast<std::time_t>(options.timeout_seconds), 0);
    server.set_write_timeout(static_cast<std::time_t>(options.timeout_seconds), 0);

    auto const upload_limit = options.max_upload_bytes;
    server.set_error_handler([upload_limit](httplib::Request const&, httplib::Response& res) {
        if (res.status == 413 && res.body.empty()) {
            respond_payload_too_large(res, upload_limit);
        }
    });

    auto transfer_controller = TransferController::Create(http_context);
    transfer_controller->register_routes(server);

    server.Get("/healthz", [&](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Healthz, res};
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/metrics", [&](httplib::Request const& req, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Metrics, res};
        auto snapshot = metrics.capture_snapshot();
        if (wants_json_response(req)) {
            write_json_response(res, metrics.snapshot_json(snapshot), 200, true);
            return;
        }
        res.set_header("Cache-Control", "no-store");
        res.set_content(metrics.render_prometheus(snapshot), "text/plain; version=0.0.4");
    });

    int bound_port = -1;
    if (options.port == 0) {
        bound_port = server.bind_to_any_port(options.host);
    } else if (server.bind_to_port(options.host, options.port)) {
        bound_port = options.port;
    }
    if (bound_port <= 0) {
        auto message = "Failed to bind " + options.host + ":" + std::to_string(options.port);
        log_error("[quickdrop] " + message);
        report_listen_status(std::unexpected(QD::Error{QD::Error::Code::IoError, message}));
        return EXIT_FAILURE;
    }

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!server.listen_after_bind()) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(std::string{"[quickdrop] Listener on "} + options.host + ":"
                          + std::to_string(bound_port) + " stopped unexpectedly");
            }
        }
    });

    log_info(std::string{"[quickdrop] Listening on http://"} + options.host + ":"
             + std::to_string(bound_port));
    log_info("[quickdrop] Shared folder: " + folder->display());

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status(bound_port);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(QD::Error{QD::Error::Code::IoError,
                                                           "transfer listener failed"}));
        } else {
            report_listen_status(std::unexpected(QD::Error{QD::Error::Code::TransferAborted,
                                                           "transfer server stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }
    log_info("[quickdrop] Stopped");

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunTransferServer(TransferOptions const& options) {
    return RunTransferServerWithStopFlag(options, g_should_stop, {}, {});
}

} // namespace QD::Web
