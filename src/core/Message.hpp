#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "core/Result.hpp"

namespace core {

constexpr uint8_t SYSEX_START = 0xF0;
constexpr uint8_t SYSEX_END   = 0xF7;

inline bool is_status_byte(uint8_t b) { return b >= 0x80; }

// Kierunek ruchu – doklejany do każdego śladu (trace)
enum class Direction { ClientToDevice, DeviceToClient };

const char* to_string(Direction d);
Direction   opposite(Direction d);

/**
 * RawMessage — jedna kompletna wiadomość MIDI, bajty bez zmian.
 * Krótka: 1..3 bajty, SysEx: F0 ... F7.
 * Konstruktor niczego nie sprawdza; walidacja to frame().
 */
class RawMessage {
public:
  explicit RawMessage(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  std::size_t size() const { return bytes_.size(); }
  uint8_t operator[](std::size_t i) const { return bytes_[i]; }
  uint8_t status() const { return bytes_.empty() ? 0 : bytes_.front(); }
  bool is_sysex() const { return !bytes_.empty() && bytes_.front() == SYSEX_START; }

  bool operator==(const RawMessage& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const RawMessage& o) const { return !(*this == o); }

private:
  std::vector<uint8_t> bytes_;
};

// Dlaczego kawałek z portu nie jest poprawną wiadomością
enum class FramingError {
  Empty,            // pusty kawałek
  MissingStatus,    // pierwszy bajt to bajt danych
  Unterminated,     // F0 bez F7 na końcu
  StrayStatusByte,  // bajt >= 0x80 w środku wiadomości
  TooLong           // krótka wiadomość dłuższa niż 3 bajty
};

const char* to_string(FramingError e);

// Sklasyfikuj kawałek z portu: krótka wiadomość albo SysEx.
// Błędny kawałek NIE jest poprawiany – odrzucamy go w całości.
Result<RawMessage, FramingError> frame(const std::vector<uint8_t>& chunk);

// "F0 7E 7F 06 01 F7"
std::string to_hex(const std::vector<uint8_t>& bytes);

// Opis krótkiej wiadomości, np. "NoteOn ch=1 note=60 vel=127".
// Dla SysEx zwraca pusty string.
std::string describe_short(const RawMessage& m);

} // namespace core
