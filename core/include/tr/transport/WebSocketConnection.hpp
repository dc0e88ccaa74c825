#pragma once
#include "tr/transport/Connection.hpp"

#include <memory>
#include <string>
#include <vector>

namespace easywsclient {
class WebSocket;
}

namespace tr {

// Connection over easywsclient. easywsclient resolves, connects and upgrades
// synchronously, so open() runs that handshake on a worker thread and returns
// at once in the Connecting state. poll() on the owning thread picks up the
// finished socket; from then on every call is non-blocking and stays on the
// owning thread. A failed handshake is reported once through takeError().
class WebSocketConnection : public Connection {
public:
  // Returns nullptr only if the handshake thread could not be started.
  static std::unique_ptr<Connection> open(const std::string& url);

  ~WebSocketConnection() override;

  ReadyState readyState() const override;
  bool sendText(const std::string& message) override;
  void poll(std::vector<std::string>& received) override;
  void close() override;
  bool takeError() override;

private:
  struct Handshake;
  using SocketPtr = std::unique_ptr<easywsclient::WebSocket,
                                    void (*)(easywsclient::WebSocket*)>;
  WebSocketConnection(std::string url, std::shared_ptr<Handshake> handshake);

  void collectHandshake();

  std::string url_;
  std::shared_ptr<Handshake> handshake_;
  SocketPtr ws_;
  bool failed_{false};
  bool errorPending_{false};
  bool closeRequested_{false};
};

// ConnectionFactory backed by WebSocketConnection::open.
ConnectionFactory webSocketConnectionFactory();

} // namespace tr
