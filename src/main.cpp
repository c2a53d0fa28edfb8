#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "ports/Clock.hpp"
#include "ports/Midi.hpp"
#include "desktop/DesktopMidi.hpp"
#include "core/ClientRole.hpp"
#include "core/DeviceRole.hpp"
#include "core/RelayEngine.hpp"
#include "core/Trace.hpp"
#include "ui/Cli.hpp"

class DesktopClock final : public ports::IClock {
public:
  uint64_t now_ms() const override {
    using namespace std::chrono;
    static const auto t0 = steady_clock::now();
    return duration_cast<milliseconds>(steady_clock::now() - t0).count();
  }
};

static std::atomic<bool> g_running{true};
void handle_sigint(int){ g_running.store(false); }

static const char* ACTION_LOG_FILE = "device_actions.log";

static void usage() {
  std::cerr <<
    "Usage:\n"
    "  midiproxy device [name]                      - device emulator on virtual ports '<name> In'/'<name> Out'\n"
    "  midiproxy client <device-in> <device-out>    - client shell connected to device ports (name substrings)\n"
    "  midiproxy proxy <name> <device-in> <device-out>\n"
    "                                               - relay between virtual ports '<name> In'/'<name> Out' and the device\n";
}

// Nieudane wpisy śladu to ostrzeżenia – podsumuj je przy wyjściu
static void report_trace_warnings(const core::TraceSink& trace) {
  if (const auto n = trace.warnings())
    std::cerr << "[TRACE] " << n << " trace line(s) could not be written\n";
}

// Czekaj na Ctrl+C (albo na zatrzymanie roli)
template <typename StillAlive>
static void idle_until_stopped(StillAlive alive) {
  using clock_t = std::chrono::steady_clock;
  auto next = clock_t::now();
  while (g_running.load() && alive()) {
    next += std::chrono::milliseconds(10);
    std::this_thread::sleep_until(next);
  }
}

static int run_device(const std::string& name, const ports::IClock& clock, core::TraceSink& trace) {
  // Plik akcji czyścimy na starcie
  if (std::remove(ACTION_LOG_FILE) == 0)
    std::cerr << "[DEVICE] cleared " << ACTION_LOG_FILE << "\n";

  auto in  = desktop_midi::makeIn(clock, {name + " In", true});
  auto out = desktop_midi::makeOut({name + " Out", true});

  core::DeviceConfig cfg;   // ID 0x01, parametry domyślnie 0
  core::DeviceRole device(cfg, *in, *out, clock, &trace,
    [](const std::string& line) {
      std::ofstream f(ACTION_LOG_FILE, std::ios::app);
      f << line << "\n";
      if (!f) throw std::runtime_error(std::string("cannot write ") + ACTION_LOG_FILE);
    });

  device.start();
  std::cout << "Device ready (id=" << (int)cfg.device_id << "). Ctrl+C to exit.\n";
  idle_until_stopped([&] { return device.running(); });
  device.stop();
  report_trace_warnings(trace);
  return device.failed() ? 1 : 0;
}

static int run_client(const std::string& dev_in, const std::string& dev_out,
                      const ports::IClock& clock, core::TraceSink& trace) {
  // Nasze wyjście -> wejście urządzenia, nasze wejście <- wyjście urządzenia
  auto out = desktop_midi::makeOut({dev_in, false});
  auto in  = desktop_midi::makeIn(clock, {dev_out, false});

  core::Client client(core::DeviceConfig{}.device_id, *in, *out, clock, &trace);
  client.start();

  ui::CommandQueue cq;
  auto cli_thread = ui::start_cli(g_running, cq);
  std::cout << "Ready. Type 'help'.\n";

  using clock_t = std::chrono::steady_clock;
  auto next = clock_t::now();

  while (g_running.load()) {
    // Komendy z CLI (aplikuj TYLKO tutaj, w wątku głównym)
    for (auto& cmd : cq.drain()) {
      using T = ui::Command::Type;
      try {
        switch (cmd.type) {
          case T::Help:     ui::print_help(); break;
          case T::Identity: client.send_identity_request(); break;
          case T::SetParam: client.send_set_parameter((uint8_t)cmd.a, (uint8_t)cmd.b); break;
          case T::GetParam: client.send_get_parameter((uint8_t)cmd.a); break;
          case T::Trigger:  client.send_trigger_action((uint8_t)cmd.a); break;
          case T::Raw:      client.send_raw(cmd.bytes); break;
          case T::Wait: {
            const auto deadline = clock_t::now() + std::chrono::milliseconds(cmd.a);
            int n = 0;
            while (clock_t::now() < deadline) {
              if (auto m = client.pop_received(std::chrono::milliseconds(20))) {
                std::cout << "reply: " << core::to_hex(m->bytes()) << "\n";
                ++n;
              }
            }
            if (n == 0) std::cout << "no reply\n";
          } break;
          case T::Clear: client.clear_received(); break;
          case T::Quit:  g_running.store(false); break;
        }
      } catch (const std::invalid_argument& e) {
        std::cout << "Rejected: " << e.what() << "\n";
      } catch (const ports::TransportError& e) {
        std::cerr << "[CLIENT] " << e.what() << "\n";
        g_running.store(false);
      }
    }

    next += std::chrono::milliseconds(10);
    std::this_thread::sleep_until(next);
  }

  client.stop();
  // wątek CLI kończy się po 'quit' albo następnej linii / EOF na stdin
  if (cli_thread.joinable()) cli_thread.join();
  report_trace_warnings(trace);
  return 0;
}

static int run_proxy(const std::string& name, const std::string& dev_in, const std::string& dev_out,
                     const ports::IClock& clock, core::TraceSink& trace) {
  auto client_in  = desktop_midi::makeIn(clock, {name + " In", true});
  auto client_out = desktop_midi::makeOut({name + " Out", true});
  auto device_out = desktop_midi::makeOut({dev_in, false});
  auto device_in  = desktop_midi::makeIn(clock, {dev_out, false});

  core::RelayEngine relay({*client_in, *client_out, *device_in, *device_out}, clock,
                          [&trace](const core::TraceRecord& r) {
                            if (!trace.emit(r)) throw std::runtime_error("trace output unavailable");
                          });
  relay.set_error_callback([](core::Direction d, const std::string& what) {
    std::cerr << "[RELAY] " << core::to_string(d) << " terminated: " << what << "\n";
  });

  relay.start();
  std::cout << "Proxy ready. Ctrl+C to exit.\n";
  idle_until_stopped([&] {
    return relay.active(core::Direction::ClientToDevice) ||
           relay.active(core::Direction::DeviceToClient);
  });
  relay.stop();
  report_trace_warnings(trace);
  return 0;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_sigint);
  DesktopClock clock;
  core::StreamTraceOutput console(std::cout);
  core::TraceSink trace(console);

  const std::string role = argc > 1 ? argv[1] : "";
  try {
    if (role == "device")
      return run_device(argc > 2 ? argv[2] : "MIDI Test Device", clock, trace);
    if (role == "client" && argc > 3)
      return run_client(argv[2], argv[3], clock, trace);
    if (role == "proxy" && argc > 4)
      return run_proxy(argv[2], argv[3], argv[4], clock, trace);
  } catch (const ports::TransportError& e) {
    std::cerr << "[MIDI] " << e.what() << "\n";
    return 1;
  }

  usage();
  return 2;
}
