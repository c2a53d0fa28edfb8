#include "core/ClientRole.hpp"

#include <iostream>

namespace core {

Client::Client(uint8_t target_device_id,
               ports::IMidiIn& in, ports::IMidiOut& out,
               const ports::IClock& clock,
               TraceSink* trace)
  : target_(target_device_id), out_(out), clock_(clock), trace_(trace),
    pump_("client", in,
          [this](ports::MidiMsg&& m) { on_message_(std::move(m)); },
          [](const ports::TransportError& e) {
            std::cerr << "[CLIENT] input lost: " << e.what() << "\n";
          }) {}

Client::~Client() { stop(); }

void Client::start() { pump_.start(); }
void Client::stop()  { pump_.stop(); }

void Client::send(const RawMessage& m) {
  send_raw(m.bytes());
}

void Client::send_raw(const std::vector<uint8_t>& bytes) {
  const uint64_t now = clock_.now_ms();
  out_.send(ports::MidiMsg{bytes, now});
  trace_msg_(Direction::ClientToDevice, now, bytes);
}

void Client::send_command(const SysExCommand& c) {
  send(encode(c));
}

void Client::send_identity_request()                  { send_command(make_identity_request()); }
void Client::send_set_parameter(uint8_t p, uint8_t v) { send_command(make_set_parameter(target_, p, v)); }
void Client::send_get_parameter(uint8_t p)            { send_command(make_get_parameter(target_, p)); }
void Client::send_trigger_action(uint8_t a)           { send_command(make_trigger_action(target_, a)); }

std::optional<RawMessage> Client::pop_received(std::chrono::milliseconds timeout) {
  return received_.wait_pop(timeout);
}

void Client::clear_received() { received_.clear(); }

void Client::on_message_(ports::MidiMsg&& m) {
  auto framed = frame(m.bytes);
  if (!framed) {
    trace_msg_(Direction::DeviceToClient, m.t_ms, m.bytes,
               std::string("FramingError: ") + to_string(framed.error()));
    return;
  }
  trace_msg_(Direction::DeviceToClient, m.t_ms, m.bytes);
  received_.push(std::move(framed.value()));
}

void Client::trace_msg_(Direction d, uint64_t t_ms, const std::vector<uint8_t>& bytes,
                        std::optional<std::string> summary) {
  if (!trace_) return;
  if (!trace_->emit(TraceRecord{d, t_ms, bytes, std::move(summary)}))
    trace_failures_.fetch_add(1);
}

} // namespace core
