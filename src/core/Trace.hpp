#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "core/Message.hpp"

namespace core {

// Jeden ślad na obserwowaną wiadomość. Nie przechowujemy go po emisji.
struct TraceRecord {
  Direction direction{Direction::ClientToDevice};
  uint64_t t_ms{0};
  std::vector<uint8_t> bytes;
  std::optional<std::string> summary;  // gdy pusty – sink spróbuje zdekodować
};

// Docelowe wyjście logu (konsola, plik, panel) – dostarcza aplikacja.
// write() może rzucić; sink zamienia to na ostrzeżenie.
struct ITraceOutput {
  virtual ~ITraceOutput() = default;
  virtual void write(const std::string& line) = 0;
};

class StreamTraceOutput final : public ITraceOutput {
public:
  explicit StreamTraceOutput(std::ostream& os) : os_(os) {}
  void write(const std::string& line) override;
private:
  std::ostream& os_;
};

/**
 * TraceSink — formatuje i emituje linie:
 *   [<direction>] <hex bytes> (<opis>)
 * Dekodowanie best-effort: błąd dekodu = same bajty, bez opisu.
 * emit() nigdy nie rzuca; wspólny dla obu kierunków relay (mutex).
 */
class TraceSink {
public:
  explicit TraceSink(ITraceOutput& out) : out_(out) {}

  static std::optional<std::string> summarize(const std::vector<uint8_t>& bytes);
  static std::string format(const TraceRecord& rec);

  // false = nie udało się wypisać (ostrzeżenie, nie błąd krytyczny)
  bool emit(const TraceRecord& rec);

  std::size_t warnings() const;

private:
  ITraceOutput& out_;
  mutable std::mutex mu_;
  std::size_t warnings_{0};
};

} // namespace core
