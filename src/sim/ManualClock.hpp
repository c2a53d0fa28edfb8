#pragma once
#include <atomic>
#include <cstdint>
#include "ports/Clock.hpp"

// Prosty zegar w ms sterowany ręcznie (testy):
// - set_ms(0) na starcie
// - advance_ms(d) gdy test "odrobi" czas
// Czytany z wątków pomp, więc atomic.
class ManualClock final : public ports::IClock
{
public:
  uint64_t now_ms() const override { return currentMs_.load(); }

  void set_ms (uint64_t ms)    { currentMs_.store(ms); }
  void advance_ms (uint64_t d) { currentMs_.fetch_add(d); }

private:
  std::atomic<uint64_t> currentMs_ { 0 };
};
