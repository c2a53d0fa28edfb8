#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include "ports/Midi.hpp"

namespace core {

/**
 * InputPump — jeden wątek na jeden kierunek.
 * Opróżnia IMidiIn tak szybko, jak przychodzą wiadomości; gdy pusto,
 * śpi 1 ms (jak pętla główna na PC).
 *
 * TransportError z poll() albo z handlera kończy TYLKO tę pompę
 * i trafia do on_error. Wiadomość w trakcie zapisu jest dokańczana
 * przed zatrzymaniem (stop() sprawdzamy między wiadomościami).
 */
class InputPump {
public:
  using Handler      = std::function<void(ports::MidiMsg&&)>;
  using ErrorHandler = std::function<void(const ports::TransportError&)>;

  InputPump(std::string name, ports::IMidiIn& in, Handler on_msg, ErrorHandler on_error)
    : name_(std::move(name)), in_(in),
      on_msg_(std::move(on_msg)), on_error_(std::move(on_error)) {}

  ~InputPump() { stop(); }

  InputPump(const InputPump&) = delete;
  InputPump& operator=(const InputPump&) = delete;

  void start() {
    if (thread_.joinable()) return;
    failed_.store(false);
    running_.store(true);
    thread_ = std::thread([this] { run_(); });
  }

  void stop() {
    running_.store(false);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
      thread_.join();
  }

  bool running() const { return running_.load(); }
  bool failed()  const { return failed_.load(); }
  const std::string& name() const { return name_; }

private:
  std::string       name_;
  ports::IMidiIn&   in_;
  Handler           on_msg_;
  ErrorHandler      on_error_;
  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};

  void run_() {
    try {
      while (running_.load()) {
        bool any = false;
        while (running_.load()) {
          auto m = in_.poll();
          if (!m) break;
          any = true;
          on_msg_(std::move(*m));
        }
        if (!any) std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    } catch (const ports::TransportError& e) {
      failed_.store(true);
      running_.store(false);
      if (on_error_) on_error_(e);
    }
  }
};

} // namespace core
