#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tr {

enum class ReadyState : std::uint8_t { Connecting = 0, Open, Closing, Closed };

// One duplex text-message channel. Implementations never block in poll().
class Connection {
public:
  virtual ~Connection() = default;

  virtual ReadyState readyState() const = 0;

  // Queue one message. Returns false if the channel is not open.
  virtual bool sendText(const std::string& message) = 0;

  // Service the channel; appends any messages received since the last call.
  virtual void poll(std::vector<std::string>& received) = 0;

  virtual void close() = 0;

  // True once per transport-level error observed since the last call.
  virtual bool takeError() = 0;
};

// Opens a connection to url. Returns nullptr when the attempt fails outright.
using ConnectionFactory =
    std::function<std::unique_ptr<Connection>(const std::string& url)>;

} // namespace tr
