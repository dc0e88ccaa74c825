#include "tr/transport/FakeConnection.hpp"

#include <utility>

namespace tr {

FakeConnection::FakeConnection(std::shared_ptr<FakeChannel> channel)
    : channel_(std::move(channel)) {}

FakeConnection::~FakeConnection() {
  if (channel_->state != ReadyState::Closed) {
    channel_->closedByClient = true;
    channel_->state = ReadyState::Closed;
  }
}

ReadyState FakeConnection::readyState() const { return channel_->state; }

bool FakeConnection::sendText(const std::string& message) {
  if (channel_->state != ReadyState::Open) return false;
  channel_->sent.push_back(message);
  return true;
}

void FakeConnection::poll(std::vector<std::string>& received) {
  if (channel_->state != ReadyState::Open) return;
  for (auto& m : channel_->incoming) received.push_back(std::move(m));
  channel_->incoming.clear();
}

void FakeConnection::close() {
  if (channel_->state == ReadyState::Closed) return;
  channel_->closedByClient = true;
  channel_->state = ReadyState::Closed;
}

bool FakeConnection::takeError() {
  bool e = channel_->errorPending;
  channel_->errorPending = false;
  return e;
}

ConnectionFactory FakeConnector::factory() {
  return [this](const std::string& url) -> std::unique_ptr<Connection> {
    ++attempts_;
    if (!config_.acceptConnections) return nullptr;

    auto ch = std::make_shared<FakeChannel>();
    ch->url = url;
    ch->state = config_.openImmediately ? ReadyState::Open : ReadyState::Connecting;
    channels_.push_back(ch);
    return std::make_unique<FakeConnection>(ch);
  };
}

std::shared_ptr<FakeChannel> FakeConnector::last() const {
  if (channels_.empty()) return nullptr;
  return channels_.back();
}

} // namespace tr
