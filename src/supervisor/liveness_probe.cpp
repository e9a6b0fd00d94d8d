#include "liveness_probe.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <cstring>

#ifndef _WIN32
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#endif

bool LivenessProbe::probe(const Endpoint& endpoint, int timeout_ms) {
    platform::init_networking();

    if (endpoint.port <= 0 || endpoint.port > 65535) return false;

    std::string host = endpoint.host == "localhost" ? "127.0.0.1" : endpoint.host;

    struct sockaddr_storage addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t addr_len = 0;
    int family = AF_INET;

    auto* v4 = reinterpret_cast<struct sockaddr_in*>(&addr);
    auto* v6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(static_cast<uint16_t>(endpoint.port));
        addr_len = sizeof(*v4);
    } else if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        family = AF_INET6;
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(static_cast<uint16_t>(endpoint.port));
        addr_len = sizeof(*v6);
    } else {
        hubwarden_log(fmt::format("LivenessProbe: not a numeric address: {}", endpoint.host));
        return false;
    }

    socket_t sock = socket(family, SOCK_STREAM, 0);
    if (sock == HUBWARDEN_INVALID_SOCKET) return false;

    platform::set_nonblocking(sock);

    int ret = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), addr_len);
    if (ret == 0) {
        platform::close_socket(sock);
        return true;
    }
    if (!platform::connect_pending()) {
        platform::close_socket(sock);
        return false;
    }

    // Wait for non-blocking connect to complete
    int revents = platform::poll_socket(sock, POLLOUT, timeout_ms);
    bool open = revents != 0 && platform::socket_error(sock) == 0;
    platform::close_socket(sock);
    return open;
}
