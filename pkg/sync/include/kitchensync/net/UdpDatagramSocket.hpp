// Repository: KitchenSync
// Component: UDP Datagram Socket
// Purpose: POSIX UDP implementation of IDatagramTransport.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_NET_UDP_DATAGRAM_SOCKET_HPP_
#define KITCHENSYNC_NET_UDP_DATAGRAM_SOCKET_HPP_

#include <atomic>
#include <mutex>

#include "kitchensync/net/DatagramTransport.hpp"

namespace kitchensync::net {

// UdpDatagramSocket binds one IPv4 UDP socket with SO_REUSEADDR (several
// nodes on one host can share a port) and, when requested, SO_BROADCAST.
//
// Receive() waits with poll() so a listener loop can observe its stop token
// at least once per timeout. Close() shuts the fd down, which also wakes a
// receiver parked in poll().
class UdpDatagramSocket : public IDatagramTransport {
 public:
  // Throws TransportError if the socket cannot be created or bound.
  explicit UdpDatagramSocket(const TransportSpec& spec);
  ~UdpDatagramSocket() override;

  UdpDatagramSocket(const UdpDatagramSocket&) = delete;
  UdpDatagramSocket& operator=(const UdpDatagramSocket&) = delete;

  bool Send(const std::string& payload, const Endpoint& to) override;
  std::optional<Datagram> Receive(std::chrono::milliseconds timeout) override;
  void Close() override;
  bool IsOpen() const override { return fd_.load(std::memory_order_acquire) >= 0; }

  // Port actually bound (resolves an ephemeral request).
  uint16_t LocalPort() const { return local_port_; }

 private:
  std::atomic<int> fd_{-1};
  uint16_t local_port_ = 0;
  std::mutex close_mutex_;
};

}  // namespace kitchensync::net

#endif  // KITCHENSYNC_NET_UDP_DATAGRAM_SOCKET_HPP_
