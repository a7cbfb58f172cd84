#pragma once

#include <quickdrop/transfer/UploadNamer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace QD::Web {

inline constexpr std::uint64_t kDefaultMaxUploadBytes = 10ull * 1024 * 1024 * 1024;
inline constexpr std::uint64_t kDefaultChunkSizeBytes = 1024 * 1024;

struct TransferOptions {
    std::string   host{"0.0.0.0"};
    int           port{5000};
    std::string   shared_folder{};
    std::uint64_t max_upload_bytes{kDefaultMaxUploadBytes};
    int           worker_threads{8};
    std::uint64_t chunk_size_bytes{kDefaultChunkSizeBytes};
    std::int64_t  timeout_seconds{120};
    bool          exclusive_create{false};
    bool          show_help{false};
};

// $HOME/Downloads/PhoneTransfer, or ./PhoneTransfer when HOME is unset.
auto DefaultSharedFolder() -> std::string;

auto ParseTransferArguments(int argc, char** argv) -> std::optional<TransferOptions>;

void PrintTransferUsage();

bool ApplyTransferEnvOverrides(TransferOptions& options);

auto ValidateTransferOptions(TransferOptions const& options) -> std::optional<std::string>;

// 0 asks the kernel for an ephemeral port.
bool IsValidTransferPort(int port);

auto NamingPolicyFor(TransferOptions const& options) -> Transfer::NamingPolicy;

} // namespace QD::Web
