// Repository: KitchenSync
// Component: UDP Datagram Socket Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/net/UdpDatagramSocket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::net {

using util::Logger;

namespace {

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

bool ToSockaddr(const Endpoint& ep, sockaddr_in* out) {
  std::memset(out, 0, sizeof(*out));
  out->sin_family = AF_INET;
  out->sin_port = htons(ep.port);
  return ::inet_pton(AF_INET, ep.host.c_str(), &out->sin_addr) == 1;
}

}  // namespace

UdpDatagramSocket::UdpDatagramSocket(const TransportSpec& spec) {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    throw TransportError(ErrnoText("socket"));
  }

  int one = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
    const std::string err = ErrnoText("setsockopt(SO_REUSEADDR)");
    ::close(fd);
    throw TransportError(err);
  }
  if (spec.allow_broadcast &&
      ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) < 0) {
    const std::string err = ErrnoText("setsockopt(SO_BROADCAST)");
    ::close(fd);
    throw TransportError(err);
  }

  sockaddr_in addr{};
  if (!ToSockaddr(Endpoint{spec.bind_address, spec.port}, &addr)) {
    ::close(fd);
    throw TransportError("invalid bind address: " + spec.bind_address);
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    const std::string err =
        ErrnoText(("bind " + spec.bind_address + ":" + std::to_string(spec.port)).c_str());
    ::close(fd);
    throw TransportError(err);
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    local_port_ = ntohs(bound.sin_port);
  } else {
    local_port_ = spec.port;
  }

  fd_.store(fd, std::memory_order_release);
  Logger::Debug("[UdpDatagramSocket] Bound " + spec.bind_address + ":" +
                std::to_string(local_port_));
}

UdpDatagramSocket::~UdpDatagramSocket() { Close(); }

bool UdpDatagramSocket::Send(const std::string& payload, const Endpoint& to) {
  const int fd = fd_.load(std::memory_order_acquire);
  if (fd < 0) return false;
  if (payload.size() > kMaxDatagramBytes) {
    Logger::Warn("[UdpDatagramSocket] Payload of " + std::to_string(payload.size()) +
                 " bytes exceeds datagram limit");
    return false;
  }

  sockaddr_in addr{};
  if (!ToSockaddr(to, &addr)) {
    Logger::Warn("[UdpDatagramSocket] Invalid destination " + to.ToString());
    return false;
  }

  const ssize_t sent = ::sendto(fd, payload.data(), payload.size(), 0,
                                reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (sent < 0) {
    Logger::Debug("[UdpDatagramSocket] " + ErrnoText("sendto") + " (" + to.ToString() + ")");
    return false;
  }
  return static_cast<size_t>(sent) == payload.size();
}

std::optional<Datagram> UdpDatagramSocket::Receive(std::chrono::milliseconds timeout) {
  const int fd = fd_.load(std::memory_order_acquire);
  if (fd < 0) return std::nullopt;

  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  const int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ret <= 0) {
    if (ret < 0 && errno != EINTR) {
      Logger::Debug("[UdpDatagramSocket] " + ErrnoText("poll"));
    }
    return std::nullopt;
  }
  if (!(pfd.revents & POLLIN)) {
    return std::nullopt;
  }

  std::vector<char> buffer(kMaxDatagramBytes + 1);
  sockaddr_in from{};
  socklen_t from_len = sizeof(from);
  const ssize_t n = ::recvfrom(fd, buffer.data(), buffer.size(), 0,
                               reinterpret_cast<sockaddr*>(&from), &from_len);
  if (n < 0) {
    Logger::Debug("[UdpDatagramSocket] " + ErrnoText("recvfrom"));
    return std::nullopt;
  }

  char host[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &from.sin_addr, host, sizeof(host));

  Datagram dgram;
  dgram.payload.assign(buffer.data(), static_cast<size_t>(n));
  dgram.from = Endpoint{host, ntohs(from.sin_port)};
  return dgram;
}

void UdpDatagramSocket::Close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  const int fd = fd_.exchange(-1, std::memory_order_acq_rel);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
}

TransportFactory MakeUdpTransportFactory() {
  return [](const TransportSpec& spec) -> std::unique_ptr<IDatagramTransport> {
    return std::make_unique<UdpDatagramSocket>(spec);
  };
}

}  // namespace kitchensync::net
