#include "core/RelayEngine.hpp"

#include <exception>
#include <iostream>

namespace core {

RelayEngine::RelayEngine(RelayPorts ports, const ports::IClock& clock, Observer observer)
  : ports_(ports), clock_(clock), observer_(std::move(observer)),
    client_pump_("relay c2d", ports_.client_in,
                 [this](ports::MidiMsg&& m) { (void)relay_chunk(m.bytes, Direction::ClientToDevice, m.t_ms); },
                 [this](const ports::TransportError& e) { fail_(Direction::ClientToDevice, e); }),
    device_pump_("relay d2c", ports_.device_in,
                 [this](ports::MidiMsg&& m) { (void)relay_chunk(m.bytes, Direction::DeviceToClient, m.t_ms); },
                 [this](const ports::TransportError& e) { fail_(Direction::DeviceToClient, e); }) {}

RelayEngine::~RelayEngine() { stop(); }

void RelayEngine::start() {
  client_pump_.start();
  device_pump_.start();
}

void RelayEngine::stop() {
  client_pump_.stop();
  device_pump_.stop();
}

bool RelayEngine::active(Direction d) const {
  if (lane_(d).failed.load()) return false;
  return d == Direction::ClientToDevice ? client_pump_.running() : device_pump_.running();
}

RelayStats RelayEngine::stats(Direction d) const {
  const Lane& l = lane_(d);
  return RelayStats{l.forwarded.load(), l.dropped.load(), l.observer_failures.load()};
}

void RelayEngine::relay(const RawMessage& inbound, Direction d) {
  Lane& lane = lane_(d);
  if (lane.failed.load())
    throw ports::TransportError(std::string("relay direction stopped: ") + to_string(d));

  // 1) bajty na przeciwny port – bez dekodowania, bez zmian
  const uint64_t now = clock_.now_ms();
  target_(d).send(ports::MidiMsg{inbound.bytes(), now});
  lane.forwarded.fetch_add(1);

  // 2) dopiero potem ślad (opis dorobi sink)
  observe_(TraceRecord{d, now, inbound.bytes(), std::nullopt});
}

bool RelayEngine::relay_chunk(const std::vector<uint8_t>& chunk, Direction d, uint64_t t_ms) {
  auto framed = frame(chunk);
  if (!framed) {
    // Nigdy nie przekazujemy kawałka częściowo – tylko ślad
    lane_(d).dropped.fetch_add(1);
    observe_(TraceRecord{d, t_ms, chunk,
                         std::string("FramingError: ") + to_string(framed.error())});
    return false;
  }
  relay(framed.value(), d);
  return true;
}

ports::IMidiOut& RelayEngine::target_(Direction d) const {
  return d == Direction::ClientToDevice ? ports_.device_out : ports_.client_out;
}

RelayEngine::Lane& RelayEngine::lane_(Direction d) {
  return d == Direction::ClientToDevice ? c2d_ : d2c_;
}

const RelayEngine::Lane& RelayEngine::lane_(Direction d) const {
  return d == Direction::ClientToDevice ? c2d_ : d2c_;
}

void RelayEngine::observe_(TraceRecord&& rec) {
  if (!observer_) return;
  try {
    observer_(rec);
  } catch (const std::exception& e) {
    // obserwator nie może zatrzymać ani zmienić przekazywania
    lane_(rec.direction).observer_failures.fetch_add(1);
    std::cerr << "[RELAY] observer failed: " << e.what() << "\n";
  }
}

void RelayEngine::fail_(Direction d, const ports::TransportError& e) {
  lane_(d).failed.store(true);
  std::cerr << "[RELAY] " << to_string(d) << " stopped: " << e.what() << "\n";
  if (on_error_) on_error_(d, e.what());
}

} // namespace core
