#include "core/Dispatcher.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace core {

// ───────────────────────────── ParameterStore ─────────────────────────────

ParameterStore::ParameterStore(uint8_t default_value) : default_(default_value) {
  if (is_status_byte(default_value))
    throw std::out_of_range("parameter default value out of range");
  values_.fill(default_);
}

uint8_t ParameterStore::get(uint8_t id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return values_.at(id);
}

void ParameterStore::set(uint8_t id, uint8_t value) {
  if (is_status_byte(value)) throw std::out_of_range("parameter value out of range");
  std::lock_guard<std::mutex> lk(mu_);
  values_.at(id) = value;
  set_.set(id);
}

bool ParameterStore::is_set(uint8_t id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return id < NUM_PARAMETERS && set_.test(id);
}

void ParameterStore::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  values_.fill(default_);
  set_.reset();
}

// ───────────────────────────── ActionRegistry ─────────────────────────────

void ActionRegistry::add(uint8_t action_id, ActionHandler handler) {
  handlers_[action_id] = std::move(handler);
}

bool ActionRegistry::remove(uint8_t action_id) {
  return handlers_.erase(action_id) > 0;
}

bool ActionRegistry::contains(uint8_t action_id) const {
  return handlers_.count(action_id) > 0;
}

std::optional<bool> ActionRegistry::invoke(uint8_t action_id, const RawMessage& request) const {
  auto it = handlers_.find(action_id);
  if (it == handlers_.end() || !it->second) return std::nullopt;
  try {
    return it->second(action_id, request);
  } catch (const std::exception& e) {
    std::cerr << "[DEVICE] action " << static_cast<int>(action_id) << " failed: " << e.what() << "\n";
    return false;
  }
}

// ───────────────────────────── Dispatcher ─────────────────────────────────

const char* to_string(DispatchState s) {
  switch (s) {
    case DispatchState::Responded: return "Responded";
    case DispatchState::Rejected:  return "Rejected";
    case DispatchState::Ignored:   return "Ignored";
  }
  return "?";
}

DispatchOutcome Dispatcher::dispatch(const RawMessage& msg) {
  auto decoded = decode(msg);
  if (!decoded) return {};
  return dispatch(decoded.value());
}

DispatchOutcome Dispatcher::dispatch(const SysExCommand& cmd) {
  const CommandKind kind = classify(cmd);

  if (kind == CommandKind::IdentityRequest) return identity_(cmd);

  // Reszta: tylko nasze komendy 0x7D adresowane do tego urządzenia
  if (cmd.manufacturer_id != sysex::MANUFACTURER_ID || cmd.device_id != device_id_)
    return {kind, DispatchState::Ignored, std::nullopt};

  switch (kind) {
    case CommandKind::SetParameter:  return set_parameter_(cmd);
    case CommandKind::GetParameter:  return get_parameter_(cmd);
    case CommandKind::TriggerAction: return trigger_action_(cmd);
    case CommandKind::ErrorReport:   // nie odpowiadamy na błędy (brak ping-ponga)
    case CommandKind::IdentityReply:
    case CommandKind::IdentityRequest:
      return {kind, DispatchState::Ignored, std::nullopt};
    case CommandKind::Unrecognized:
      break;
  }
  return reject_(kind, ErrorCode::UnknownCommand, cmd.command_id);
}

DispatchOutcome Dispatcher::identity_(const SysExCommand& cmd) {
  if (cmd.device_id != sysex::ALL_CALL && cmd.device_id != device_id_)
    return {CommandKind::IdentityRequest, DispatchState::Ignored, std::nullopt};
  return {CommandKind::IdentityRequest, DispatchState::Responded, encode(make_identity_reply())};
}

// sub_id != 0 nie da się zakodować dla 0x7D – odrzucamy przed jakimkolwiek zapisem
DispatchOutcome Dispatcher::set_parameter_(const SysExCommand& cmd) {
  const auto& p = cmd.payload;
  if (cmd.sub_id != 0 || p.size() != 2 || is_status_byte(p[0]) || is_status_byte(p[1]))
    return reject_(CommandKind::SetParameter, ErrorCode::InvalidParameter, cmd.command_id);

  params_.set(p[0], p[1]);
  return echo_(CommandKind::SetParameter, cmd);
}

DispatchOutcome Dispatcher::get_parameter_(const SysExCommand& cmd) {
  const auto& p = cmd.payload;
  if (cmd.sub_id != 0 || p.size() != 1 || is_status_byte(p[0]))
    return reject_(CommandKind::GetParameter, ErrorCode::InvalidParameter, cmd.command_id);

  const uint8_t value = params_.get(p[0]);
  return {CommandKind::GetParameter, DispatchState::Responded,
          encode(make_get_parameter_reply(device_id_, p[0], value))};
}

DispatchOutcome Dispatcher::trigger_action_(const SysExCommand& cmd) {
  const auto& p = cmd.payload;
  if (cmd.sub_id != 0 || p.size() != 1 || is_status_byte(p[0]))
    return reject_(CommandKind::TriggerAction, ErrorCode::InvalidParameter, cmd.command_id);

  const uint8_t action = p[0];
  if (!actions_.contains(action))
    return reject_(CommandKind::TriggerAction, ErrorCode::UnknownCommand, cmd.command_id);

  // Handler synchronicznie; efekty uboczne (np. wpis do pliku) to jego sprawa
  const auto ok = actions_.invoke(action, encode(cmd));
  if (!ok || !*ok)
    return reject_(CommandKind::TriggerAction, ErrorCode::ActionFailed, cmd.command_id);
  return echo_(CommandKind::TriggerAction, cmd);
}

DispatchOutcome Dispatcher::reject_(CommandKind kind, ErrorCode code, uint8_t original_command) const {
  return {kind, DispatchState::Rejected, encode(make_error_report(device_id_, code, original_command))};
}

DispatchOutcome Dispatcher::echo_(CommandKind kind, const SysExCommand& cmd) {
  // Potwierdzenie = ta sama wiadomość. Nigdy nie ma CommandId 7F,
  // więc strukturalnie różni się od ErrorReport.
  return {kind, DispatchState::Responded, encode(cmd)};
}

} // namespace core
