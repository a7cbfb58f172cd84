#include <quickdrop/web/TransferHttpServer.hpp>

#include <future>
#include <string>
#include <utility>

namespace QD::Web {

auto TransferHttpServer::default_server_launcher() -> ServerLauncher {
    return [](TransferOptions const&                 options,
              std::atomic<bool>&                     should_stop,
              TransferLogHooks const&                log_hooks,
              std::function<void(QD::Expected<int>)> on_listen) {
        return RunTransferServerWithStopFlag(options, should_stop, log_hooks, std::move(on_listen));
    };
}

TransferHttpServer::TransferHttpServer(TransferOptions  options,
                                       TransferLogHooks log_hooks,
                                       ServerLauncher   launcher)
    : options_(std::move(options))
    , log_hooks_(std::move(log_hooks))
    , launcher_(std::move(launcher)) {
    if (!launcher_) {
        launcher_ = default_server_launcher();
    }
}

TransferHttpServer::~TransferHttpServer() {
    stop();
}

auto TransferHttpServer::start() -> QD::Expected<void> {
    if (server_thread_.joinable()) {
        if (running_.load(std::memory_order_acquire)) {
            return std::unexpected(
                QD::Error{QD::Error::Code::InvalidError, "TransferHttpServer already running"});
        }
        server_thread_.join();
    }

    if (auto invalid = ValidateTransferOptions(options_)) {
        return std::unexpected(QD::Error{QD::Error::Code::MalformedInput, *invalid});
    }

    stop_flag_->store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    auto ready_promise  = std::make_shared<std::promise<QD::Expected<int>>>();
    auto ready_future   = ready_promise->get_future();
    auto ready_reported = std::make_shared<std::atomic<bool>>(false);

    server_thread_ = std::thread([options   = options_,
                                  stop_flag = stop_flag_,
                                  launcher  = launcher_,
                                  log_hooks = log_hooks_,
                                  running   = &running_,
                                  ready_promise,
                                  ready_reported]() {
        auto on_listen = [ready_promise, ready_reported](QD::Expected<int> status) {
            bool expected = false;
            if (!ready_reported->compare_exchange_strong(expected, true)) {
                return;
            }
            ready_promise->set_value(std::move(status));
        };

        auto exit_code = launcher(options, *stop_flag, log_hooks, on_listen);
        if (!ready_reported->exchange(true)) {
            ready_promise->set_value(std::unexpected(QD::Error{
                QD::Error::Code::UnknownError,
                "transfer server exited with code " + std::to_string(exit_code) + " before listening"}));
        }
        running->store(false, std::memory_order_release);
    });

    auto status = ready_future.get();
    if (!status) {
        stop_flag_->store(true, std::memory_order_release);
        server_thread_.join();
        running_.store(false, std::memory_order_release);
        return std::unexpected(status.error());
    }
    port_ = *status;
    return {};
}

void TransferHttpServer::stop() {
    if (!server_thread_.joinable()) {
        running_.store(false, std::memory_order_release);
        return;
    }

    stop_flag_->store(true, std::memory_order_release);
    server_thread_.join();
    running_.store(false, std::memory_order_release);
}

} // namespace QD::Web
