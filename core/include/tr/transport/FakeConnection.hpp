#pragma once
#include "tr/transport/Connection.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tr {

// Far end of a FakeConnection; shared so tests can keep driving it after the
// session has dropped its Connection.
struct FakeChannel {
  std::string url;
  ReadyState state{ReadyState::Connecting};
  bool errorPending{false};
  bool closedByClient{false};
  std::vector<std::string> sent;      // client -> server
  std::vector<std::string> incoming;  // server -> client, drained by poll()

  void open() { state = ReadyState::Open; }
  void drop() { state = ReadyState::Closed; }
  void fail() { errorPending = true; state = ReadyState::Closed; }
};

class FakeConnection : public Connection {
public:
  explicit FakeConnection(std::shared_ptr<FakeChannel> channel);
  ~FakeConnection() override;

  ReadyState readyState() const override;
  bool sendText(const std::string& message) override;
  void poll(std::vector<std::string>& received) override;
  void close() override;
  bool takeError() override;

private:
  std::shared_ptr<FakeChannel> channel_;
};

// In-memory ConnectionFactory. Records every attempt.
struct FakeConnectorConfig {
  bool acceptConnections{true};  // false: factory returns nullptr
  bool openImmediately{true};    // false: channel stays Connecting until open()
};

class FakeConnector {
public:
  FakeConnector() = default;
  explicit FakeConnector(const FakeConnectorConfig& config) : config_(config) {}

  void setConfig(const FakeConnectorConfig& config) { config_ = config; }

  ConnectionFactory factory();

  std::size_t attempts() const { return attempts_; }
  const std::vector<std::shared_ptr<FakeChannel>>& channels() const { return channels_; }

  // Most recently created channel, or nullptr.
  std::shared_ptr<FakeChannel> last() const;

private:
  FakeConnectorConfig config_;
  std::size_t attempts_{0};
  std::vector<std::shared_ptr<FakeChannel>> channels_;
};

} // namespace tr
