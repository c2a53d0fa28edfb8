#include "core/Message.hpp"

#include <cstdio>
#include <sstream>

namespace core {

const char* to_string(Direction d) {
  switch (d) {
    case Direction::ClientToDevice: return "ClientToDevice";
    case Direction::DeviceToClient: return "DeviceToClient";
  }
  return "?";
}

Direction opposite(Direction d) {
  return d == Direction::ClientToDevice ? Direction::DeviceToClient
                                        : Direction::ClientToDevice;
}

const char* to_string(FramingError e) {
  switch (e) {
    case FramingError::Empty:           return "Empty";
    case FramingError::MissingStatus:   return "MissingStatus";
    case FramingError::Unterminated:    return "Unterminated";
    case FramingError::StrayStatusByte: return "StrayStatusByte";
    case FramingError::TooLong:         return "TooLong";
  }
  return "?";
}

Result<RawMessage, FramingError> frame(const std::vector<uint8_t>& chunk) {
  if (chunk.empty()) return FramingError::Empty;
  if (!is_status_byte(chunk.front())) return FramingError::MissingStatus;

  if (chunk.front() == SYSEX_START) {
    if (chunk.size() < 2 || chunk.back() != SYSEX_END) return FramingError::Unterminated;
    // wnętrze SysEx: same bajty danych
    for (std::size_t i = 1; i + 1 < chunk.size(); ++i)
      if (is_status_byte(chunk[i])) return FramingError::StrayStatusByte;
    return RawMessage{chunk};
  }

  if (chunk.size() > 3) return FramingError::TooLong;
  for (std::size_t i = 1; i < chunk.size(); ++i)
    if (is_status_byte(chunk[i])) return FramingError::StrayStatusByte;
  return RawMessage{chunk};
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  char buf[4];
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned>(bytes[i]));
    if (i) out += ' ';
    out += buf;
  }
  return out;
}

std::string describe_short(const RawMessage& m) {
  if (m.size() == 0 || m.is_sysex()) return {};

  const uint8_t status = m.status();
  const int d1 = m.size() > 1 ? m[1] : 0;
  const int d2 = m.size() > 2 ? m[2] : 0;

  std::ostringstream os;
  if (status < 0xF0) {
    const int ch = (status & 0x0F) + 1;   // kanał 1..16
    switch (status & 0xF0) {
      case 0x80: os << "NoteOff ch=" << ch << " note=" << d1 << " vel=" << d2; break;
      case 0x90: os << "NoteOn ch=" << ch << " note=" << d1 << " vel=" << d2; break;
      case 0xA0: os << "PolyPressure ch=" << ch << " note=" << d1 << " value=" << d2; break;
      case 0xB0: os << "ControlChange ch=" << ch << " cc=" << d1 << " value=" << d2; break;
      case 0xC0: os << "ProgramChange ch=" << ch << " program=" << d1; break;
      case 0xD0: os << "ChannelPressure ch=" << ch << " value=" << d1; break;
      case 0xE0: os << "PitchBend ch=" << ch << " value=" << (d1 | (d2 << 7)); break;
    }
    return os.str();
  }

  switch (status) {
    case 0xF1: os << "TimeCode value=" << d1; break;
    case 0xF2: os << "SongPosition value=" << (d1 | (d2 << 7)); break;
    case 0xF3: os << "SongSelect song=" << d1; break;
    case 0xF6: os << "TuneRequest"; break;
    case 0xF8: os << "Clock"; break;
    case 0xFA: os << "Start"; break;
    case 0xFB: os << "Continue"; break;
    case 0xFC: os << "Stop"; break;
    case 0xFE: os << "ActiveSensing"; break;
    case 0xFF: os << "Reset"; break;
    default:   os << "System status=" << to_hex({status}); break;
  }
  return os.str();
}

} // namespace core
