#include "tr/transport/TransportSession.hpp"
#include "tr/command/CommandCodec.hpp"

#include <cstdio>
#include <utility>
#include <vector>

namespace tr {

const char* statusLabel(SessionStatus status) {
  switch (status) {
    case SessionStatus::Connecting:   return "Connecting";
    case SessionStatus::Connected:    return "Connected";
    case SessionStatus::Disconnected: return "Disconnected";
    case SessionStatus::Error:        return "Error";
  }
  return "Unknown";
}

std::string buildEndpointUrl(const std::string& host, const std::string& path,
                             bool secure) {
  std::string url = secure ? "wss://" : "ws://";
  url += host;
  std::size_t start = 0;
  while (start < path.size() && path[start] == '/') start++;
  url += '/';
  url.append(path, start, std::string::npos);
  return url;
}

TransportSession::TransportSession(const TransportSessionConfig& config,
                                   ConnectionFactory factory,
                                   Scheduler& scheduler)
    : config_(config), factory_(std::move(factory)), scheduler_(scheduler) {}

TransportSession::~TransportSession() {
  listener_ = nullptr;
  stopped_ = true;
  if (reconnectTimer_ != kNoTimer) scheduler_.cancel(reconnectTimer_);
  releaseConnection();
}

void TransportSession::connect() {
  stopped_ = false;

  if (reconnectTimer_ != kNoTimer) {
    scheduler_.cancel(reconnectTimer_);
    reconnectTimer_ = kNoTimer;
  }

  if (connection_) {
    ReadyState st = connection_->readyState();
    if (st == ReadyState::Connecting || st == ReadyState::Open) return;
    releaseConnection();
  }

  ++attempts_;
  setStatus(SessionStatus::Connecting);
  std::fprintf(stderr, "[TransportSession] connecting to %s\n",
               config_.url.c_str());

  if (factory_) connection_ = factory_(config_.url);

  if (!connection_) {
    handleEvent(TransportEvent::Errored);
    handleEvent(TransportEvent::Closed);
    return;
  }

  switch (connection_->readyState()) {
    case ReadyState::Open:
      handleEvent(TransportEvent::Opened);
      break;
    case ReadyState::Closing:
    case ReadyState::Closed:
      if (connection_->takeError()) handleEvent(TransportEvent::Errored);
      handleEvent(TransportEvent::Closed);
      break;
    case ReadyState::Connecting:
      break;  // pump() reports the outcome
  }
}

void TransportSession::stop() {
  stopped_ = true;
  if (reconnectTimer_ != kNoTimer) {
    scheduler_.cancel(reconnectTimer_);
    reconnectTimer_ = kNoTimer;
  }
  releaseConnection();
  setStatus(SessionStatus::Disconnected);
}

bool TransportSession::send(const Command& cmd) {
  if (status_ != SessionStatus::Connected || !connection_) return false;
  return connection_->sendText(encodeCommand(cmd));
}

void TransportSession::pump() {
  if (!connection_) return;

  std::vector<std::string> received;
  connection_->poll(received);
  for (const auto& msg : received) {
    std::fprintf(stderr, "[TransportSession] message from server: %s\n",
                 msg.c_str());
  }

  if (connection_->takeError()) handleEvent(TransportEvent::Errored);

  // Errored may not close the socket; the close is reported separately.
  if (!connection_) return;
  ReadyState st = connection_->readyState();
  if (st == ReadyState::Open && status_ == SessionStatus::Connecting) {
    handleEvent(TransportEvent::Opened);
  } else if (st == ReadyState::Closed) {
    handleEvent(TransportEvent::Closed);
  }
}

void TransportSession::handleEvent(TransportEvent ev) {
  if (stopped_) return;

  switch (ev) {
    case TransportEvent::Opened:
      if (!connection_ || status_ == SessionStatus::Connected) return;
      setStatus(SessionStatus::Connected);
      std::fprintf(stderr, "[TransportSession] connected\n");
      break;

    case TransportEvent::Errored:
      std::fprintf(stderr, "[TransportSession] transport error on %s\n",
                   config_.url.c_str());
      setStatus(SessionStatus::Error);
      break;

    case TransportEvent::Closed: {
      releaseConnection();
      bool alreadyWaiting = status_ == SessionStatus::Disconnected &&
                            reconnectPending();
      setStatus(SessionStatus::Disconnected);
      if (!alreadyWaiting) {
        std::fprintf(stderr,
                     "[TransportSession] disconnected, reconnecting in %dms\n",
                     config_.reconnectIntervalMs);
      }
      scheduleReconnect();
      break;
    }
  }
}

void TransportSession::setStatusListener(StatusListener listener) {
  listener_ = std::move(listener);
}

StatusView TransportSession::statusView() const {
  StatusView v;
  v.label = statusLabel(status_);
  v.connected = status_ == SessionStatus::Connected;
  return v;
}

bool TransportSession::reconnectPending() const {
  return scheduler_.isPending(reconnectTimer_);
}

void TransportSession::setStatus(SessionStatus s) {
  if (s == status_) return;
  status_ = s;
  if (listener_) listener_(statusView());
}

void TransportSession::scheduleReconnect() {
  if (stopped_ || reconnectPending()) return;

  reconnectTimer_ = scheduler_.schedule(config_.reconnectIntervalMs, [this] {
    reconnectTimer_ = kNoTimer;
    connect();
  });
}

void TransportSession::releaseConnection() {
  if (!connection_) return;
  if (connection_->readyState() != ReadyState::Closed) connection_->close();
  connection_.reset();
}

} // namespace tr
