#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "ports/Clock.hpp"
#include "ports/Midi.hpp"
#include "core/InputPump.hpp"
#include "core/Message.hpp"
#include "core/Trace.hpp"

namespace core {

// Dwie pary portów proxy: od strony klienta i od strony urządzenia
struct RelayPorts {
  ports::IMidiIn&  client_in;    // klient -> proxy
  ports::IMidiOut& client_out;   // proxy -> klient
  ports::IMidiIn&  device_in;    // urządzenie -> proxy
  ports::IMidiOut& device_out;   // proxy -> urządzenie
};

struct RelayStats {
  uint64_t forwarded{0};
  uint64_t dropped{0};    // odrzucone przez ramkowanie
  uint64_t observer_failures{0};  // ślad się nie udał, wiadomość i tak poszła
};

/**
 * RelayEngine — przezroczyste proxy w obie strony.
 *
 *  - bajty przechodzą 1:1, kolejność w obrębie kierunku zachowana,
 *  - między kierunkami brak globalnej kolejności (dwa niezależne wątki),
 *  - NIE dekodujemy SysEx do przekazania; dekoduje (opcjonalnie) tylko
 *    obserwator/sink, a jego błąd niczego nie blokuje,
 *  - TransportError zatrzymuje tylko swój kierunek.
 */
class RelayEngine {
public:
  using Observer      = std::function<void(const TraceRecord&)>;
  using ErrorCallback = std::function<void(Direction, const std::string&)>;

  RelayEngine(RelayPorts ports, const ports::IClock& clock, Observer observer = {});
  ~RelayEngine();

  RelayEngine(const RelayEngine&) = delete;
  RelayEngine& operator=(const RelayEngine&) = delete;

  void set_error_callback(ErrorCallback cb) { on_error_ = std::move(cb); }

  // Przekaż wiadomość na przeciwny port, potem ślad do obserwatora.
  // Rzuca ports::TransportError, gdy port docelowy nie działa.
  void relay(const RawMessage& inbound, Direction d);

  // Kawałek z portu: ramkowanie + relay. false = odrzucony (tylko ślad).
  bool relay_chunk(const std::vector<uint8_t>& chunk, Direction d, uint64_t t_ms);

  void start();   // dwa wątki, po jednym na kierunek
  void stop();    // czeka, aż wiadomości w locie dojdą

  bool active(Direction d) const;
  RelayStats stats(Direction d) const;

private:
  struct Lane {
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> observer_failures{0};
    std::atomic<bool>     failed{false};
  };

  RelayPorts           ports_;
  const ports::IClock& clock_;
  Observer             observer_;
  ErrorCallback        on_error_;
  Lane                 c2d_;
  Lane                 d2c_;
  InputPump            client_pump_;   // ClientToDevice
  InputPump            device_pump_;   // DeviceToClient

  ports::IMidiOut& target_(Direction d) const;
  Lane&            lane_(Direction d);
  const Lane&      lane_(Direction d) const;
  void             observe_(TraceRecord&& rec);
  void             fail_(Direction d, const ports::TransportError& e);
};

} // namespace core
