#include "tr/transport/WebSocketConnection.hpp"
#include <easywsclient/easywsclient.hpp>

#include <cstdio>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace tr {

static void deleteSocket(easywsclient::WebSocket* p) {
  if (p && p != easywsclient::WebSocket::create_dummy()) delete p;
}

static void closeSocket(easywsclient::WebSocket* p) {
  if (p && p->getReadyState() != easywsclient::WebSocket::CLOSED) {
    p->close();
    p->poll(0);
  }
}

// Shared between the owning thread and the handshake worker. The worker
// outlives the connection when the connection is dropped mid-handshake.
struct WebSocketConnection::Handshake {
  std::mutex mutex;
  bool finished{false};
  bool abandoned{false};
  SocketPtr socket{nullptr, &deleteSocket};
};

std::unique_ptr<Connection> WebSocketConnection::open(const std::string& url) {
  auto hs = std::make_shared<Handshake>();

  try {
    std::thread([hs, url] {
      SocketPtr ws(easywsclient::WebSocket::from_url(url), &deleteSocket);
      std::lock_guard<std::mutex> lock(hs->mutex);
      if (hs->abandoned) {
        closeSocket(ws.get());
        return;
      }
      hs->socket = std::move(ws);
      hs->finished = true;
    }).detach();
  } catch (const std::system_error& e) {
    std::fprintf(stderr, "[WebSocketConnection] cannot start handshake for %s: %s\n",
                 url.c_str(), e.what());
    return nullptr;
  }

  return std::unique_ptr<Connection>(new WebSocketConnection(url, std::move(hs)));
}

WebSocketConnection::WebSocketConnection(std::string url,
                                         std::shared_ptr<Handshake> handshake)
    : url_(std::move(url)), handshake_(std::move(handshake)),
      ws_(nullptr, &deleteSocket) {}

WebSocketConnection::~WebSocketConnection() {
  SocketPtr unclaimed(nullptr, &deleteSocket);
  {
    std::lock_guard<std::mutex> lock(handshake_->mutex);
    handshake_->abandoned = true;
    unclaimed = std::move(handshake_->socket);
  }
  closeSocket(unclaimed.get());
  closeSocket(ws_.get());
}

void WebSocketConnection::collectHandshake() {
  if (ws_ || failed_ || closeRequested_) return;

  {
    std::lock_guard<std::mutex> lock(handshake_->mutex);
    if (!handshake_->finished) return;
    ws_ = std::move(handshake_->socket);
  }

  if (!ws_ || ws_->getReadyState() == easywsclient::WebSocket::CLOSED) {
    std::fprintf(stderr, "[WebSocketConnection] could not open %s\n", url_.c_str());
    failed_ = true;
    errorPending_ = true;
  }
}

ReadyState WebSocketConnection::readyState() const {
  if (failed_) return ReadyState::Closed;
  if (!ws_) return closeRequested_ ? ReadyState::Closed : ReadyState::Connecting;

  switch (ws_->getReadyState()) {
    case easywsclient::WebSocket::CONNECTING: return ReadyState::Connecting;
    case easywsclient::WebSocket::OPEN:       return ReadyState::Open;
    case easywsclient::WebSocket::CLOSING:    return ReadyState::Closing;
    case easywsclient::WebSocket::CLOSED:
    default:                                  return ReadyState::Closed;
  }
}

bool WebSocketConnection::sendText(const std::string& message) {
  if (closeRequested_ || !ws_ ||
      ws_->getReadyState() != easywsclient::WebSocket::OPEN) {
    return false;
  }
  ws_->send(message);
  return true;
}

void WebSocketConnection::poll(std::vector<std::string>& received) {
  collectHandshake();
  if (!ws_ || failed_ ||
      ws_->getReadyState() == easywsclient::WebSocket::CLOSED) {
    return;
  }

  ws_->poll(0);
  ws_->dispatch([&received](const std::string& msg) {
    received.push_back(msg);
  });
}

void WebSocketConnection::close() {
  if (closeRequested_) return;
  closeRequested_ = true;
  closeSocket(ws_.get());
}

bool WebSocketConnection::takeError() {
  bool had = errorPending_;
  errorPending_ = false;
  return had;
}

ConnectionFactory webSocketConnectionFactory() {
  return [](const std::string& url) { return WebSocketConnection::open(url); };
}

} // namespace tr
