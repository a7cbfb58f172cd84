#include <quickdrop/bridge/ProcessRunner.hpp>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

namespace QD::Bridge {

namespace {

constexpr int kExecFailedExitCode = 127;

Error errno_error(std::string const& what) {
    return Error{Error::Code::IoError, what + ": " + std::strerror(errno)};
}

class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(Pipe const&)                    = delete;
    auto operator=(Pipe const&) -> Pipe& = delete;

    auto open() -> bool {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0) {
            return false;
        }
        read_fd_  = fds[0];
        write_fd_ = fds[1];
        ::fcntl(read_fd_, F_SETFD, FD_CLOEXEC);
        ::fcntl(write_fd_, F_SETFD, FD_CLOEXEC);
        return true;
    }

    [[nodiscard]] auto read_fd() const -> int { return read_fd_; }
    [[nodiscard]] auto write_fd() const -> int { return write_fd_; }

    void close_read() {
        if (read_fd_ >= 0) {
            ::close(read_fd_);
            read_fd_ = -1;
        }
    }
    void close_write() {
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }

private:
    int read_fd_{-1};
    int write_fd_{-1};
};

auto wait_for_child(pid_t child) -> Expected<int> {
    int status = 0;
    while (::waitpid(child, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(errno_error("waitpid failed"));
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

auto RunProcess(std::vector<std::string> const& argv, OutputMode mode) -> Expected<ProcessResult> {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "empty command line"});
    }

    Pipe output_pipe;
    if (mode == OutputMode::Capture && !output_pipe.open()) {
        return std::unexpected(errno_error("pipe failed"));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto const& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    auto child = ::fork();
    if (child == -1) {
        return std::unexpected(errno_error("fork failed"));
    }
    if (child == 0) {
        if (mode == OutputMode::Capture) {
            ::dup2(output_pipe.write_fd(), STDOUT_FILENO);
        }
        ::execvp(args.front(), args.data());
        ::_exit(kExecFailedExitCode);
    }

    ProcessResult        result{};
    std::optional<Error> read_error;
    if (mode == OutputMode::Capture) {
        output_pipe.close_write();
        std::array<char, 4096> buffer{};
        for (;;) {
            auto const got = ::read(output_pipe.read_fd(), buffer.data(), buffer.size());
            if (got > 0) {
                result.output.append(buffer.data(), static_cast<std::size_t>(got));
                continue;
            }
            if (got < 0 && errno == EINTR) {
                continue;
            }
            if (got < 0) {
                read_error = errno_error("reading child output failed");
            }
            break;
        }
        output_pipe.close_read();
    }

    auto exit_code = wait_for_child(child);
    if (!exit_code) {
        return std::unexpected(exit_code.error());
    }
    if (read_error) {
        return std::unexpected(*read_error);
    }
    result.exit_code = *exit_code;
    return result;
}

auto FindOnPath(std::string_view name) -> std::optional<std::filesystem::path> {
    const char* raw = std::getenv("PATH");
    if (raw == nullptr || name.empty()) {
        return std::nullopt;
    }
    std::string_view remaining{raw};
    while (true) {
        auto const colon = remaining.find(':');
        auto       dir   = remaining.substr(0, colon);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path{dir} / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        if (colon == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(colon + 1);
    }
    return std::nullopt;
}

} // namespace QD::Bridge
