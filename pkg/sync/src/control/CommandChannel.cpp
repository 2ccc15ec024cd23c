// Repository: KitchenSync
// Component: Command Channel Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/control/CommandChannel.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "kitchensync/protocol/MessageCodec.hpp"
#include "kitchensync/util/Logger.hpp"

namespace kitchensync::control {

using util::Logger;

CommandChannel::CommandChannel(CommandChannelConfig config,
                               std::shared_ptr<timing::MasterClock> clock,
                               net::TransportFactory transport_factory)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      transport_factory_(std::move(transport_factory)),
      listener_("CommandChannel") {}

CommandChannel::~CommandChannel() { Stop(); }

void CommandChannel::RegisterHandler(protocol::MessageType type, Handler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[type] = std::move(handler);
}

void CommandChannel::SetAddressResolver(AddressResolver resolver) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  resolver_ = std::move(resolver);
}

void CommandChannel::Open() {
  std::lock_guard<std::mutex> lock(transport_mutex_);
  if (transport_) return;
  transport_ = transport_factory_(
      net::TransportSpec{config_.bind_address, config_.control_port, true});
  Logger::Info("[CommandChannel] Bound control port " + std::to_string(config_.control_port));
}

void CommandChannel::Listen() {
  Open();
  listener_.Start([this](const runtime::StopToken& token) { Loop(token); });
}

void CommandChannel::Stop() {
  std::shared_ptr<net::IDatagramTransport> transport;
  {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    transport = std::move(transport_);
  }
  listener_.RequestStop();
  if (transport) transport->Close();
  listener_.Join();
  if (transport) {
    Logger::Info("[CommandChannel] Closed control port " + std::to_string(config_.control_port));
  }
}

bool CommandChannel::IsOpen() const {
  std::lock_guard<std::mutex> lock(transport_mutex_);
  return transport_ != nullptr;
}

bool CommandChannel::Broadcast(const protocol::Message& message) {
  return SendEnvelope(message, net::Endpoint{config_.broadcast_address, config_.control_port});
}

bool CommandChannel::SendTo(const std::string& id, const protocol::Message& message) {
  AddressResolver resolver;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    resolver = resolver_;
  }
  std::optional<net::Endpoint> address;
  if (resolver) address = resolver(id);
  if (!address) {
    Logger::Debug("[CommandChannel] No address for " + id + ", broadcasting");
    return Broadcast(message);
  }
  // Collaborators listen on the control port, not on their source port.
  return SendEnvelope(message, net::Endpoint{address->host, config_.control_port});
}

bool CommandChannel::SendEnvelope(const protocol::Message& message, const net::Endpoint& to) {
  auto payload = protocol::MessageCodec::Encode(message, clock_->now_utc_s());
  bool ok = false;
  if (payload) {
    std::shared_ptr<net::IDatagramTransport> transport;
    {
      std::lock_guard<std::mutex> lock(transport_mutex_);
      transport = transport_;
    }
    ok = transport && transport->Send(*payload, to);
  }
  if (ok) {
    sent_.fetch_add(1, std::memory_order_relaxed);
  } else {
    send_failures_.fetch_add(1, std::memory_order_relaxed);
    Logger::Warn(std::string("[CommandChannel] Failed to send ") +
                 protocol::MessageTypeName(protocol::TypeOf(message)) + " to " + to.ToString());
  }
  return ok;
}

bool CommandChannel::Dispatch(const std::string& payload, const net::Endpoint& from) {
  auto decoded = protocol::MessageCodec::Decode(payload);
  if (!decoded) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  const protocol::MessageType type = protocol::TypeOf(decoded->message);
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(type);
    if (it != handlers_.end()) handler = it->second;
  }
  if (!handler) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  try {
    handler(decoded->message, from);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[CommandChannel] Handler for ") + protocol::MessageTypeName(type) +
                  " failed: " + e.what());
    return false;
  }
  handled_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void CommandChannel::Loop(const runtime::StopToken& token) {
  std::shared_ptr<net::IDatagramTransport> transport;
  {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    transport = transport_;
  }
  if (!transport) return;

  const auto timeout = std::chrono::milliseconds(
      static_cast<int64_t>(config_.poll_interval_s * 1000.0));
  while (!token.StopRequested()) {
    auto dgram = transport->Receive(timeout);
    if (!dgram) {
      if (!transport->IsOpen()) break;
      continue;
    }
    Dispatch(dgram->payload, dgram->from);
  }
}

}  // namespace kitchensync::control
