#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ports {

// Jeden kompletny komunikat z portu (bajty 1:1 + timestamp w ms).
// Transport oddaje całe wiadomości – nie skleja SysEx z kawałków.
struct MidiMsg {
  std::vector<uint8_t> bytes;  // np. {0x90, 0x3C, 0x7F} albo F0 ... F7
  uint64_t t_ms{0};            // timestamp w ms (od IClock)
};

// Port zniknął / jest zamknięty. Zatrzymuje tylko swój kierunek.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Wejście MIDI: non-blocking poll() — zwraca wiadomość albo std::nullopt
struct IMidiIn {
  virtual ~IMidiIn() = default;
  virtual std::optional<MidiMsg> poll() = 0;  // rzuca TransportError
};

// Wyjście MIDI: send() — wysyła jeden komunikat w całości
struct IMidiOut {
  virtual ~IMidiOut() = default;
  virtual void send(const MidiMsg& msg) = 0;  // rzuca TransportError
};

} // namespace ports
