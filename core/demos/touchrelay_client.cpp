// TouchRelay client
// Reads gesture primitives and UI actions from stdin, relays the resulting
// remote-input commands over a WebSocket to the TouchRelay server.
// Protocol:
//   stdin:  newline-delimited JSON (see tr/input/InputLine.hpp)
//   stdout: one status line per session transition: "STATUS <label> <0|1>"
//
// Usage: touchrelay_client [--host HOST:PORT] [--path ws] [--secure]
//                          [--settings FILE] [--reconnect-ms N]

#include "tr/config/Settings.hpp"
#include "tr/input/InputLine.hpp"
#include "tr/session/TouchpadController.hpp"
#include "tr/timing/Clock.hpp"
#include "tr/timing/Scheduler.hpp"
#include "tr/transport/TransportSession.hpp"
#include "tr/transport/WebSocketConnection.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

struct ClientConfig {
  std::string host{"localhost:8000"};
  std::string path{"ws"};
  bool secure{false};
  std::string settingsPath{"touchrelay_settings.json"};
  int reconnectIntervalMs{3000};
};

static ClientConfig parseArgs(int argc, char* argv[]) {
  ClientConfig cfg;
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--host" && i + 1 < argc) {
      cfg.host = argv[++i];
    } else if (a == "--path" && i + 1 < argc) {
      cfg.path = argv[++i];
    } else if (a == "--secure") {
      cfg.secure = true;
    } else if (a == "--settings" && i + 1 < argc) {
      cfg.settingsPath = argv[++i];
    } else if (a == "--reconnect-ms" && i + 1 < argc) {
      cfg.reconnectIntervalMs = std::atoi(argv[++i]);
      if (cfg.reconnectIntervalMs <= 0) {
        throw std::runtime_error("--reconnect-ms must be a positive integer");
      }
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  return cfg;
}

static void handleLine(const std::string& line, tr::TouchpadController& controller) {
  if (line.empty()) return;

  tr::InputLine in;
  std::string error;
  if (!tr::parseInputLine(line, in, error)) {
    std::fprintf(stderr, "[client] ignoring input line (%s): %s\n",
                 error.c_str(), line.c_str());
    return;
  }

  switch (in.kind) {
    case tr::InputLineKind::Gesture:
      controller.handleGesture(in.gesture);
      break;
    case tr::InputLineKind::Text:
      if (controller.sendText(in.text, in.appendEnter) ==
          tr::TextSendOutcome::Rejected) {
        std::printf("ALERT Not connected to server, cannot send text\n");
        std::fflush(stdout);
      }
      break;
    case tr::InputLineKind::Key:
      controller.sendKey(in.text);
      break;
    case tr::InputLineKind::Sensitivity:
      controller.setMoveFactor(in.value);
      break;
  }
}

int main(int argc, char* argv[]) {
  ClientConfig cfg;
  try {
    cfg = parseArgs(argc, argv);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "touchrelay_client: %s\n", e.what());
    return 2;
  }

  tr::SteadyClock clock;
  tr::Scheduler scheduler(clock);

  tr::TransportSessionConfig sessionCfg;
  sessionCfg.url = tr::buildEndpointUrl(cfg.host, cfg.path, cfg.secure);
  sessionCfg.reconnectIntervalMs = cfg.reconnectIntervalMs;

  tr::TransportSession session(sessionCfg, tr::webSocketConnectionFactory(), scheduler);
  session.setStatusListener([](const tr::StatusView& v) {
    std::printf("STATUS %s %d\n", v.label.c_str(), v.connected ? 1 : 0);
    std::fflush(stdout);
  });

  tr::JsonFileSettingsStore store(cfg.settingsPath);
  tr::TouchpadController controller(session, scheduler, store);
  controller.loadSettings();

  session.connect();

  std::string pending;
  bool inputOpen = true;

  for (;;) {
    // Wake for stdin, the next timer, or the socket poll interval.
    int timeoutMs = 10;
    tr::TimeMs untilTimer = scheduler.msUntilNext();
    if (untilTimer >= 0 && untilTimer < timeoutMs) {
      timeoutMs = static_cast<int>(untilTimer);
    }

    if (inputOpen) {
      pollfd pfd{STDIN_FILENO, POLLIN, 0};
      int rc = ::poll(&pfd, 1, timeoutMs);
      if (rc < 0 && errno != EINTR) {
        std::fprintf(stderr, "[client] poll failed: errno=%d\n", errno);
        break;
      }
      if (rc > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
        char buf[4096];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
          inputOpen = false;
          if (!pending.empty()) handleLine(pending, controller);
          pending.clear();
        } else {
          pending.append(buf, static_cast<std::size_t>(n));
          std::size_t nl;
          while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            handleLine(line, controller);
          }
        }
      }
    } else {
      // Input closed: drain pending single-tap clicks, then exit.
      if (!controller.taps().hasPendingSingleTap()) break;
      ::usleep(static_cast<useconds_t>(timeoutMs) * 1000);
    }

    session.pump();
    scheduler.runDue();
  }

  std::fprintf(stderr, "[client] input closed, sent=%llu dropped=%llu\n",
               static_cast<unsigned long long>(controller.sentCount()),
               static_cast<unsigned long long>(controller.droppedCount()));
  session.stop();
  return 0;
}
