#pragma once
#include <array>
#include <bitset>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include "core/Message.hpp"
#include "core/SysEx.hpp"

namespace core {

constexpr std::size_t NUM_PARAMETERS = 128;

/**
 * ParameterStore — parametr 0..127 -> wartość 0..127.
 * Nieustawiony parametr zwraca wartość domyślną (domyślnie 0).
 * Dostęp serializowany mutexem: get po set z innego wątku widzi zapis.
 */
class ParameterStore {
public:
  static constexpr uint8_t DEFAULT_VALUE = 0;

  explicit ParameterStore(uint8_t default_value = DEFAULT_VALUE);

  uint8_t get(uint8_t id) const;          // std::out_of_range dla id > 127
  void    set(uint8_t id, uint8_t value); // std::out_of_range dla id/value > 127
  bool    is_set(uint8_t id) const;
  void    reset();

  uint8_t default_value() const { return default_; }

private:
  mutable std::mutex mu_;
  uint8_t default_;
  std::array<uint8_t, NUM_PARAMETERS> values_{};
  std::bitset<NUM_PARAMETERS> set_{};
};

// Handler akcji: true = sukces. Wyjątek liczy się jako porażka.
using ActionHandler = std::function<bool(uint8_t action_id, const RawMessage& request)>;

constexpr uint8_t ACTION_LOG = 0x01;   // obowiązkowa akcja "log"

class ActionRegistry {
public:
  void add(uint8_t action_id, ActionHandler handler);
  bool remove(uint8_t action_id);
  bool contains(uint8_t action_id) const;

  // std::nullopt = brak takiej akcji; inaczej wynik handlera
  std::optional<bool> invoke(uint8_t action_id, const RawMessage& request) const;

private:
  std::map<uint8_t, ActionHandler> handlers_;
};

// Received -> Validated -> Responded  albo  Received -> Rejected.
// Ignored: komenda nie do nas / nie nasza sprawa, brak odpowiedzi.
enum class DispatchState { Responded, Rejected, Ignored };

const char* to_string(DispatchState s);

struct DispatchOutcome {
  CommandKind kind{CommandKind::Unrecognized};
  DispatchState state{DispatchState::Ignored};
  std::optional<RawMessage> response;   // co najwyżej jedna odpowiedź
};

/**
 * Dispatcher (rola urządzenia): komenda -> handler -> odpowiedź.
 * Stan (parametry, akcje) przekazany jawnie – kilka urządzeń może żyć
 * w jednym procesie. Nie blokuje, nie ponawia.
 */
class Dispatcher {
public:
  Dispatcher(uint8_t device_id, ParameterStore& params, ActionRegistry& actions)
    : device_id_(device_id), params_(params), actions_(actions) {
    if (is_status_byte(device_id)) throw std::invalid_argument("device id must be 0..127");
  }

  DispatchOutcome dispatch(const SysExCommand& cmd);
  DispatchOutcome dispatch(const RawMessage& msg);  // nie-SysEx / błąd dekodu -> Ignored

  uint8_t device_id() const { return device_id_; }

private:
  uint8_t          device_id_;
  ParameterStore&  params_;
  ActionRegistry&  actions_;

  DispatchOutcome identity_(const SysExCommand& cmd);
  DispatchOutcome set_parameter_(const SysExCommand& cmd);
  DispatchOutcome get_parameter_(const SysExCommand& cmd);
  DispatchOutcome trigger_action_(const SysExCommand& cmd);

  DispatchOutcome reject_(CommandKind kind, ErrorCode code, uint8_t original_command) const;
  static DispatchOutcome echo_(CommandKind kind, const SysExCommand& cmd);
};

} // namespace core
