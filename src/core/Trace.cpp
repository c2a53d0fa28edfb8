#include "core/Trace.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include "core/SysEx.hpp"

namespace core {

void StreamTraceOutput::write(const std::string& line) {
  os_ << line << '\n';
  os_.flush();
  if (!os_) throw std::runtime_error("trace stream is not writable");
}

std::optional<std::string> TraceSink::summarize(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) return std::nullopt;
  RawMessage m{bytes};
  if (m.is_sysex()) {
    auto decoded = decode(m);
    if (!decoded) return std::nullopt;
    return core::summarize(decoded.value());
  }
  auto framed = frame(bytes);
  if (!framed) return std::nullopt;
  std::string s = describe_short(framed.value());
  if (s.empty()) return std::nullopt;
  return s;
}

std::string TraceSink::format(const TraceRecord& rec) {
  std::string line = "[";
  line += to_string(rec.direction);
  line += "] ";
  line += to_hex(rec.bytes);

  const auto summary = rec.summary ? rec.summary : summarize(rec.bytes);
  if (summary && !summary->empty()) {
    line += " (";
    line += *summary;
    line += ")";
  }
  return line;
}

bool TraceSink::emit(const TraceRecord& rec) {
  std::string line;
  try {
    line = format(rec);
  } catch (const std::exception& e) {
    std::lock_guard<std::mutex> lk(mu_);
    ++warnings_;
    std::cerr << "[TRACE] format failed: " << e.what() << "\n";
    return false;
  }

  std::lock_guard<std::mutex> lk(mu_);
  try {
    out_.write(line);
    return true;
  } catch (const std::exception& e) {
    ++warnings_;
    std::cerr << "[TRACE] output unavailable: " << e.what() << "\n";
    return false;
  }
}

std::size_t TraceSink::warnings() const {
  std::lock_guard<std::mutex> lk(mu_);
  return warnings_;
}

} // namespace core
