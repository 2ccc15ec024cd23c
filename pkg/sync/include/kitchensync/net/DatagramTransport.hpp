// Repository: KitchenSync
// Component: Datagram Transport
// Purpose: Unreliable, connectionless message transport used by both channels.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_NET_DATAGRAM_TRANSPORT_HPP_
#define KITCHENSYNC_NET_DATAGRAM_TRANSPORT_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace kitchensync::net {

// Largest payload a single UDP datagram can carry over IPv4.
inline constexpr size_t kMaxDatagramBytes = 65507;

inline constexpr const char* kDefaultBroadcastAddress = "255.255.255.255";
inline constexpr const char* kAnyAddress = "0.0.0.0";

struct Endpoint {
  std::string host;
  uint16_t port = 0;

  std::string ToString() const { return host + ":" + std::to_string(port); }

  bool operator==(const Endpoint& other) const {
    return host == other.host && port == other.port;
  }
};

struct Datagram {
  std::string payload;
  Endpoint from;
};

// Thrown when a channel cannot be opened or bound. Startup-only; steady-state
// send and receive failures are reported through return values.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// IDatagramTransport is one bound endpoint.
//
// Delivery: at most once, unordered, possibly duplicated. Nothing is retried.
class IDatagramTransport {
 public:
  virtual ~IDatagramTransport() = default;

  // Sends one datagram. Returns false on failure (never throws).
  virtual bool Send(const std::string& payload, const Endpoint& to) = 0;

  // Waits up to `timeout` for one datagram. Returns nullopt on timeout, on
  // receive error, or once the transport is closed.
  virtual std::optional<Datagram> Receive(std::chrono::milliseconds timeout) = 0;

  // Releases the underlying resource. Idempotent.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;
};

// What to bind: a local port (0 = ephemeral, send-only) with broadcast
// permission.
struct TransportSpec {
  std::string bind_address = kAnyAddress;
  uint16_t port = 0;
  bool allow_broadcast = true;
};

// Opens a transport or throws TransportError. Components take a factory so
// tests can swap in an in-memory network.
using TransportFactory =
    std::function<std::unique_ptr<IDatagramTransport>(const TransportSpec& spec)>;

// Factory for real UDP sockets.
TransportFactory MakeUdpTransportFactory();

}  // namespace kitchensync::net

#endif  // KITCHENSYNC_NET_DATAGRAM_TRANSPORT_HPP_
