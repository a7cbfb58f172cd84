#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>
#include <quickdrop/transfer/UploadNamer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace QD::Transfer {

struct UploadFailure {
    std::string client_filename;
    Error       error;
};

struct UploadResult {
    std::vector<std::string>   uploaded;
    std::vector<UploadFailure> failed;
    bool                       saw_files_field{false};
};

// Stores the file parts of one multipart request as they arrive.
//
// Parts are fed in wire order: begin_part() for each part header, write() for each
// slice of its body. Only parts of the `files` field are kept; a part without a client
// filename is skipped. A part whose filename filters down to nothing is reported in
// `failed` with InvalidPath. A part that fails to open or write is closed, its partial
// file removed, and it is reported in `failed` while the following parts are still stored.
class UploadSession {
public:
    static constexpr std::string_view kFilesField = "files";

    UploadSession(SharedFolder const& folder, NamingPolicy policy);
    ~UploadSession();

    UploadSession(UploadSession const&)                    = delete;
    auto operator=(UploadSession const&) -> UploadSession& = delete;

    void begin_part(std::string_view field_name, std::string_view client_filename);
    void write(char const* data, std::size_t length);

    // Closes the last part and hands back the outcome. The session is spent afterwards.
    [[nodiscard]] auto finish() -> UploadResult;

    [[nodiscard]] auto bytes_received() const -> std::uint64_t { return bytes_received_; }

private:
    struct ActivePart {
        std::string  client_filename;
        UploadTarget target;
    };

    void end_part();
    void fail_part(Error error);

    SharedFolder const&       folder_;
    NamingPolicy              policy_;
    std::optional<ActivePart> active_;
    std::uint64_t             bytes_received_{0};
    bool                      finished_{false};
    UploadResult              result_;
};

} // namespace QD::Transfer
