#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/web/TransferOptions.hpp>
#include <quickdrop/web/TransferServer.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace QD::Web {

// Runs the transfer server on a background thread. start() returns once the listener
// is bound (or failed to bind), so port() is meaningful right after a successful start.
class TransferHttpServer {
public:
    using ServerLauncher = std::function<int(TransferOptions const&,
                                             std::atomic<bool>&,
                                             TransferLogHooks const&,
                                             std::function<void(QD::Expected<int>)>)>;

    explicit TransferHttpServer(TransferOptions  options,
                                TransferLogHooks log_hooks = {},
                                ServerLauncher   launcher  = default_server_launcher());

    TransferHttpServer(TransferHttpServer const&)                    = delete;
    auto operator=(TransferHttpServer const&) -> TransferHttpServer& = delete;

    ~TransferHttpServer();

    [[nodiscard]] auto start() -> QD::Expected<void>;
    void                stop();
    [[nodiscard]] auto is_running() const -> bool { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] auto port() const -> int { return port_; }
    [[nodiscard]] auto options() const -> TransferOptions const& { return options_; }

    static auto default_server_launcher() -> ServerLauncher;

private:
    TransferOptions                    options_;
    TransferLogHooks                   log_hooks_;
    ServerLauncher                     launcher_;
    std::thread                        server_thread_{};
    std::shared_ptr<std::atomic<bool>> stop_flag_{std::make_shared<std::atomic<bool>>(false)};
    std::atomic<bool>                  running_{false};
    int                                port_{0};
};

} // namespace QD::Web
