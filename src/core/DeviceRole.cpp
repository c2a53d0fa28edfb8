#include "core/DeviceRole.hpp"

#include <iostream>
#include <sstream>

namespace core {

DeviceRole::DeviceRole(const DeviceConfig& cfg,
                       ports::IMidiIn& in, ports::IMidiOut& out,
                       const ports::IClock& clock,
                       TraceSink* trace,
                       ActionLog action_log)
  : cfg_(cfg), out_(out), clock_(clock), trace_(trace),
    action_log_(std::move(action_log)),
    params_(cfg.default_parameter_value),
    dispatcher_(cfg.device_id, params_, actions_),
    pump_("device", in,
          [this](ports::MidiMsg&& m) { (void)handle(m); },
          [](const ports::TransportError& e) {
            std::cerr << "[DEVICE] transport error, stopping: " << e.what() << "\n";
          }) {
  // Akcja 0x01 jest obowiązkowa: zapisz wpis i potwierdź
  actions_.add(ACTION_LOG, [this](uint8_t id, const RawMessage& request) {
    const std::string line = format_action_log(id, request);
    if (action_log_) action_log_(line);
    else std::cerr << "[DEVICE] " << line << "\n";
    return true;
  });
}

DeviceRole::~DeviceRole() { stop(); }

void DeviceRole::start() { pump_.start(); }
void DeviceRole::stop()  { pump_.stop(); }

std::optional<RawMessage> DeviceRole::handle(const ports::MidiMsg& m) {
  auto framed = frame(m.bytes);
  if (!framed) {
    trace_msg_(Direction::ClientToDevice, m.t_ms, m.bytes,
               std::string("FramingError: ") + to_string(framed.error()));
    return std::nullopt;
  }

  const RawMessage& msg = framed.value();
  if (!msg.is_sysex()) {
    // Krótkie wiadomości (nuty, CC...) tylko śledzimy
    trace_msg_(Direction::ClientToDevice, m.t_ms, m.bytes);
    return std::nullopt;
  }

  auto decoded = decode(msg);
  if (!decoded) {
    trace_msg_(Direction::ClientToDevice, m.t_ms, m.bytes,
               std::string("DecodeError: ") + to_string(decoded.error()));
    return std::nullopt;
  }
  trace_msg_(Direction::ClientToDevice, m.t_ms, m.bytes);

  DispatchOutcome out = dispatcher_.dispatch(decoded.value());
  if (!out.response) return std::nullopt;

  const uint64_t now = clock_.now_ms();
  out_.send(ports::MidiMsg{out.response->bytes(), now});
  trace_msg_(Direction::DeviceToClient, now, out.response->bytes());
  return out.response;
}

std::string DeviceRole::format_action_log(uint8_t action_id, const RawMessage& request) {
  std::ostringstream os;
  os << "TriggerAction: ID=" << static_cast<int>(action_id) << ", FullMsg=[";
  for (std::size_t i = 0; i < request.size(); ++i) {
    if (i) os << ", ";
    os << static_cast<int>(request[i]);
  }
  os << "]";
  return os.str();
}

void DeviceRole::trace_msg_(Direction d, uint64_t t_ms, const std::vector<uint8_t>& bytes,
                            std::optional<std::string> summary) {
  if (!trace_) return;
  TraceRecord rec{d, t_ms, bytes, std::move(summary)};
  if (!trace_->emit(rec)) trace_failures_.fetch_add(1);   // ostrzeżenie, obsługa idzie dalej
}

} // namespace core
