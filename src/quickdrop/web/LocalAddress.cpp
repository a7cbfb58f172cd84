#include <quickdrop/web/LocalAddress.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cstdint>

namespace QD::Web {

namespace {

constexpr char const*    kFallbackAddress = "127.0.0.1";
constexpr char const*    kRouteAddress    = "8.8.8.8";
constexpr std::uint16_t  kRoutePort       = 80;

class SocketHandle {
public:
    explicit SocketHandle(int fd)
        : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketHandle(SocketHandle const&)                    = delete;
    auto operator=(SocketHandle const&) -> SocketHandle& = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }

private:
    int fd_{-1};
};

} // namespace

auto DiscoverLocalAddress() -> std::string {
    SocketHandle sock{::socket(AF_INET, SOCK_DGRAM, 0)};
    if (sock.get() < 0) {
        return kFallbackAddress;
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port   = htons(kRoutePort);
    if (::inet_pton(AF_INET, kRouteAddress, &target.sin_addr) != 1) {
        return kFallbackAddress;
    }
    if (::connect(sock.get(), reinterpret_cast<sockaddr const*>(&target), sizeof(target)) != 0) {
        return kFallbackAddress;
    }

    sockaddr_in local{};
    socklen_t   length = sizeof(local);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &length) != 0) {
        return kFallbackAddress;
    }

    std::array<char, INET_ADDRSTRLEN> buffer{};
    if (::inet_ntop(AF_INET, &local.sin_addr, buffer.data(), buffer.size()) == nullptr) {
        return kFallbackAddress;
    }
    return std::string{buffer.data()};
}

auto MakeShareUrl(std::string const& address, int port) -> std::string {
    return "http://" + address + ":" + std::to_string(port);
}

} // namespace QD::Web
