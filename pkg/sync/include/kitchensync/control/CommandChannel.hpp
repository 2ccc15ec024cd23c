// Repository: KitchenSync
// Component: Command Channel
// Purpose: Bidirectional control-message dispatch over the broadcast transport.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_CONTROL_COMMAND_CHANNEL_HPP_
#define KITCHENSYNC_CONTROL_COMMAND_CHANNEL_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kitchensync/net/DatagramTransport.hpp"
#include "kitchensync/protocol/Messages.hpp"
#include "kitchensync/runtime/BackgroundTask.hpp"
#include "kitchensync/timing/MasterClock.h"

namespace kitchensync::control {

inline constexpr uint16_t kDefaultControlPort = 5006;

struct CommandChannelConfig {
  uint16_t control_port = kDefaultControlPort;
  std::string bind_address = net::kAnyAddress;
  std::string broadcast_address = net::kDefaultBroadcastAddress;
  double poll_interval_s = 0.25;
};

// CommandChannel
//
// Inbound: every datagram is decoded once into a protocol::Message and handed
// to the handler registered for its type. Unknown or malformed datagrams and
// types with no handler are dropped; nothing is ever acknowledged.
//
// Outbound: Broadcast() sends to the broadcast address; SendTo() resolves a
// collaborator id to its address and falls back to broadcast when the id is
// unknown. Every envelope is stamped with the sender's wall clock.
//
// Handlers run on the listener task and must be idempotent: a lossy
// broadcast may be delivered twice or not at all.
class CommandChannel {
 public:
  using Handler = std::function<void(const protocol::Message&, const net::Endpoint& from)>;
  using AddressResolver = std::function<std::optional<net::Endpoint>(const std::string& id)>;

  CommandChannel(CommandChannelConfig config, std::shared_ptr<timing::MasterClock> clock,
                 net::TransportFactory transport_factory);
  ~CommandChannel();

  CommandChannel(const CommandChannel&) = delete;
  CommandChannel& operator=(const CommandChannel&) = delete;

  // Replaces any handler already registered for `type`.
  void RegisterHandler(protocol::MessageType type, Handler handler);

  void SetAddressResolver(AddressResolver resolver);

  // Binds the control port. Throws net::TransportError on failure. No-op if
  // already open.
  void Open();

  // Opens if needed and starts the listener task.
  void Listen();

  // Stops the listener and releases the socket. Idempotent.
  void Stop();

  bool IsOpen() const;
  bool IsListening() const { return listener_.IsRunning(); }

  bool Broadcast(const protocol::Message& message);
  bool SendTo(const std::string& id, const protocol::Message& message);

  // Decodes and dispatches one payload. Returns true if a handler ran.
  // Called by the listener; exposed for tests.
  bool Dispatch(const std::string& payload, const net::Endpoint& from);

  uint64_t MessagesSent() const { return sent_.load(std::memory_order_relaxed); }
  uint64_t SendFailures() const { return send_failures_.load(std::memory_order_relaxed); }
  uint64_t MessagesHandled() const { return handled_.load(std::memory_order_relaxed); }
  uint64_t MessagesDropped() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  bool SendEnvelope(const protocol::Message& message, const net::Endpoint& to);
  void Loop(const runtime::StopToken& token);

  CommandChannelConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  net::TransportFactory transport_factory_;

  mutable std::mutex transport_mutex_;
  std::shared_ptr<net::IDatagramTransport> transport_;

  mutable std::mutex handlers_mutex_;
  std::map<protocol::MessageType, Handler> handlers_;
  AddressResolver resolver_;

  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> send_failures_{0};
  std::atomic<uint64_t> handled_{0};
  std::atomic<uint64_t> dropped_{0};

  runtime::BackgroundTask listener_;
};

}  // namespace kitchensync::control

#endif  // KITCHENSYNC_CONTROL_COMMAND_CHANNEL_HPP_
