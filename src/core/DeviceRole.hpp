#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "ports/Clock.hpp"
#include "ports/Midi.hpp"
#include "core/Dispatcher.hpp"
#include "core/InputPump.hpp"
#include "core/Trace.hpp"

namespace core {

// Konfiguracja emulatora urządzenia
struct DeviceConfig {
  uint8_t device_id = 0x01;                                    // ID w komendach 0x7D
  uint8_t default_parameter_value = ParameterStore::DEFAULT_VALUE;
};

/**
 * DeviceRole — emulator urządzenia.
 * Jeden wątek drenuje wejście: ramkowanie -> dekod -> Dispatcher -> odpowiedź.
 * Parametry i akcje należą do tej instancji i dotyka ich tylko ten wątek
 * (ParameterStore i tak ma mutex).
 */
class DeviceRole {
public:
  // Dokąd trafia wpis akcji "log" (plik, konsola...) – decyduje aplikacja
  using ActionLog = std::function<void(const std::string& line)>;

  DeviceRole(const DeviceConfig& cfg,
             ports::IMidiIn& in, ports::IMidiOut& out,
             const ports::IClock& clock,
             TraceSink* trace = nullptr,
             ActionLog action_log = {});
  ~DeviceRole();

  DeviceRole(const DeviceRole&) = delete;
  DeviceRole& operator=(const DeviceRole&) = delete;

  void start();
  void stop();
  bool running() const { return pump_.running(); }
  bool failed()  const { return pump_.failed(); }

  // Obsłuż jeden kawałek z portu; zwraca wysłaną odpowiedź (jeśli była).
  // TransportError z wyjścia leci dalej.
  std::optional<RawMessage> handle(const ports::MidiMsg& m);

  ParameterStore&       parameters()       { return params_; }
  const ParameterStore& parameters() const { return params_; }
  ActionRegistry&       actions()          { return actions_; }
  const DeviceConfig&   config()     const { return cfg_; }

  // Ile śladów tej roli nie dało się wypisać (ostrzeżenia, obsługa szła dalej)
  std::size_t trace_failures() const { return trace_failures_.load(); }

  // "TriggerAction: ID=1, FullMsg=[240, 125, 1, 3, 1, 247]"
  static std::string format_action_log(uint8_t action_id, const RawMessage& request);

private:
  DeviceConfig         cfg_;
  ports::IMidiOut&     out_;
  const ports::IClock& clock_;
  TraceSink*           trace_;
  ActionLog            action_log_;
  std::atomic<std::size_t> trace_failures_{0};

  ParameterStore params_;
  ActionRegistry actions_;
  Dispatcher     dispatcher_;
  InputPump      pump_;   // ostatni: niszczony pierwszy

  void trace_msg_(Direction d, uint64_t t_ms, const std::vector<uint8_t>& bytes,
                  std::optional<std::string> summary = std::nullopt);
};

} // namespace core
