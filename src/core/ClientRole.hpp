#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "ports/Clock.hpp"
#include "ports/Midi.hpp"
#include "core/InputPump.hpp"
#include "core/Message.hpp"
#include "core/SysEx.hpp"
#include "core/Trace.hpp"
#include "core/TsQueue.hpp"

namespace core {

/**
 * Client — emulator aplikacji klienckiej.
 * Wysyła komendy do urządzenia o danym ID i zbiera odpowiedzi
 * (osobny wątek drenuje wejście do kolejki).
 */
class Client {
public:
  Client(uint8_t target_device_id,
         ports::IMidiIn& in, ports::IMidiOut& out,
         const ports::IClock& clock,
         TraceSink* trace = nullptr);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  void start();
  void stop();
  bool running() const { return pump_.running(); }

  // Wysyłka – rzuca ports::TransportError, gdy port nie działa
  void send(const RawMessage& m);
  void send_raw(const std::vector<uint8_t>& bytes);   // bez walidacji (testy protokołu)
  void send_command(const SysExCommand& c);           // std::invalid_argument dla złych bajtów

  void send_identity_request();
  void send_set_parameter(uint8_t param, uint8_t value);
  void send_get_parameter(uint8_t param);
  void send_trigger_action(uint8_t action);

  // Odebrane (poprawnie zramkowane) wiadomości, w kolejności przyjścia
  std::optional<RawMessage> pop_received(std::chrono::milliseconds timeout = std::chrono::milliseconds(100));
  void clear_received();

  uint8_t target_device_id() const { return target_; }
  std::size_t trace_failures() const { return trace_failures_.load(); }

private:
  uint8_t              target_;
  ports::IMidiOut&     out_;
  const ports::IClock& clock_;
  TraceSink*           trace_;
  std::atomic<std::size_t> trace_failures_{0};
  TsQueue<RawMessage>  received_;
  InputPump            pump_;

  void on_message_(ports::MidiMsg&& m);
  void trace_msg_(Direction d, uint64_t t_ms, const std::vector<uint8_t>& bytes,
                  std::optional<std::string> summary = std::nullopt);
};

} // namespace core
