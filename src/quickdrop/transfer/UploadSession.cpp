#include <quickdrop/transfer/UploadSession.hpp>

#include <system_error>
#include <utility>

namespace QD::Transfer {

UploadSession::UploadSession(SharedFolder const& folder, NamingPolicy policy)
    : folder_{folder}
    , policy_{policy} {}

// A session dropped before finish() belongs to an aborted request: the part being
// written is closed and left on disk as received.
UploadSession::~UploadSession() = default;

void UploadSession::begin_part(std::string_view field_name, std::string_view client_filename) {
    end_part();
    if (finished_ || field_name != kFilesField) {
        return;
    }
    result_.saw_files_field = true;
    if (client_filename.empty()) {
        return;
    }

    auto safe_name = SecureFilename(client_filename);
    if (safe_name.empty()) {
        result_.failed.push_back(UploadFailure{std::string{client_filename},
                                               Error{Error::Code::InvalidPath, "file name has no safe characters"}});
        return;
    }

    auto target = CreateUploadTarget(safe_name, folder_, policy_);
    if (!target) {
        result_.failed.push_back(UploadFailure{std::string{client_filename}, target.error()});
        return;
    }
    active_.emplace(ActivePart{std::string{client_filename}, std::move(*target)});
}

void UploadSession::write(char const* data, std::size_t length) {
    if (!active_ || length == 0) {
        return;
    }
    auto status = active_->target.file.write(data, length);
    if (!status) {
        fail_part(status.error());
        return;
    }
    bytes_received_ += length;
}

auto UploadSession::finish() -> UploadResult {
    end_part();
    finished_ = true;
    return std::move(result_);
}

void UploadSession::end_part() {
    if (!active_) {
        return;
    }
    auto status = active_->target.file.close();
    if (!status) {
        fail_part(status.error());
        return;
    }
    result_.uploaded.push_back(std::move(active_->target.name));
    active_.reset();
}

void UploadSession::fail_part(Error error) {
    if (!active_) {
        return;
    }
    // The close result is irrelevant: the part is already lost.
    (void)active_->target.file.close();
    std::error_code ec;
    std::filesystem::remove(active_->target.path, ec);
    if (ec) {
        error.message = error.message.value_or("") + " (partial file kept: " + ec.message() + ")";
    }
    result_.failed.push_back(UploadFailure{std::move(active_->client_filename), std::move(error)});
    active_.reset();
}

} // namespace QD::Transfer
