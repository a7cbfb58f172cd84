#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/web/TransferOptions.hpp>

#include <atomic>
#include <functional>
#include <string_view>

namespace QD::Web {

struct TransferLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

int RunTransferServer(TransferOptions const& options);

// Serves until `should_stop` is raised. `on_listen` is called exactly once, with the
// bound port or with the reason the server could not start.
int RunTransferServerWithStopFlag(TransferOptions const&                 options,
                                  std::atomic<bool>&                     should_stop,
                                  TransferLogHooks const&                log_hooks = {},
                                  std::function<void(QD::Expected<int>)> on_listen = {});

void RequestTransferStop();
void ResetTransferStopFlag();

} // namespace QD::Web
