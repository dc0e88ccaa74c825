#pragma once
#include "tr/command/Command.hpp"
#include "tr/timing/Scheduler.hpp"
#include "tr/transport/Connection.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tr {

enum class SessionStatus : std::uint8_t { Connecting = 0, Connected, Disconnected, Error };

// What the external UI shows: a label plus a "connected" indicator.
struct StatusView {
  std::string label;
  bool connected{false};
};

const char* statusLabel(SessionStatus status);

// Inbound transport events. Every transition goes through handleEvent().
enum class TransportEvent : std::uint8_t { Opened = 0, Closed, Errored };

struct TransportSessionConfig {
  std::string url;                // ws://host/path
  int reconnectIntervalMs{3000};  // fixed, never grows
};

// ws:// or wss:// endpoint for host/path, mirroring the page scheme.
std::string buildEndpointUrl(const std::string& host, const std::string& path,
                             bool secure);

// Owns at most one connection. Reconnects forever after every close, with a
// fixed delay and at most one pending reconnect timer. Single-threaded: call
// connect(), send() and pump() from the thread that runs the Scheduler.
class TransportSession {
public:
  using StatusListener = std::function<void(const StatusView&)>;

  TransportSession(const TransportSessionConfig& config,
                   ConnectionFactory factory,
                   Scheduler& scheduler);
  ~TransportSession();

  TransportSession(const TransportSession&) = delete;
  TransportSession& operator=(const TransportSession&) = delete;

  // Start a connection attempt unless one is already live. Cancels a pending
  // reconnect timer.
  void connect();

  // Close the connection and stop reconnecting until the next connect().
  void stop();

  // Fire-and-forget. Returns false, with no side effects, unless Connected.
  bool send(const Command& cmd);

  // Service the connection: log server messages and turn ready-state
  // changes into transport events.
  void pump();

  void handleEvent(TransportEvent ev);

  void setStatusListener(StatusListener listener);

  SessionStatus status() const { return status_; }
  StatusView statusView() const;
  bool isConnected() const { return status_ == SessionStatus::Connected; }

  bool hasConnection() const { return connection_ != nullptr; }
  bool reconnectPending() const;
  std::uint64_t connectAttempts() const { return attempts_; }
  const TransportSessionConfig& config() const { return config_; }

private:
  void setStatus(SessionStatus s);
  void scheduleReconnect();
  void releaseConnection();

  TransportSessionConfig config_;
  ConnectionFactory factory_;
  Scheduler& scheduler_;

  std::unique_ptr<Connection> connection_;
  SessionStatus status_{SessionStatus::Disconnected};
  TimerId reconnectTimer_{kNoTimer};
  bool stopped_{true};
  std::uint64_t attempts_{0};
  StatusListener listener_;
};

} // namespace tr
