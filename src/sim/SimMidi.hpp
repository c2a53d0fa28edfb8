#pragma once
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "core/TsQueue.hpp"
#include "ports/Midi.hpp"

using MidiQueue = core::TsQueue<ports::MidiMsg>;

// Symulowane wejście MIDI — czyta z kolejki (wypełnianej przez drugi koniec kabla).
// Po close() poll() zgłasza TransportError, jak odłączony port.
class SimMidiIn final : public ports::IMidiIn {
public:
  explicit SimMidiIn(MidiQueue& q, std::string name = "sim in") : q_(q), name_(std::move(name)) {}

  std::optional<ports::MidiMsg> poll() override {
    if (closed_.load()) throw ports::TransportError(name_ + " is closed");
    return q_.try_pop(); // non-blocking
  }

  void close() { closed_.store(true); }

private:
  MidiQueue&        q_;
  std::string       name_;
  std::atomic<bool> closed_{false};
};

// Symulowane wyjście MIDI — wkłada całą wiadomość do kolejki drugiego końca.
class SimMidiOut final : public ports::IMidiOut {
public:
  explicit SimMidiOut(MidiQueue& q, std::string name = "sim out") : q_(q), name_(std::move(name)) {}

  void send(const ports::MidiMsg& m) override {
    if (closed_.load()) throw ports::TransportError(name_ + " is closed");
    q_.push(m);
  }

  void close() { closed_.store(true); }

private:
  MidiQueue&        q_;
  std::string       name_;
  std::atomic<bool> closed_{false};
};

// Wirtualny kabel: co wejdzie w `out`, wyjdzie z `in` (w tej samej kolejności).
struct SimCable {
  explicit SimCable(const std::string& name = "sim")
    : out(queue, name + " out"), in(queue, name + " in") {}

  MidiQueue  queue;
  SimMidiOut out;
  SimMidiIn  in;

  // Czekaj na wiadomość po stronie odbiorcy (testy bez wątku pompy)
  std::optional<ports::MidiMsg> wait(std::chrono::milliseconds timeout) {
    return queue.wait_pop(timeout);
  }
};
