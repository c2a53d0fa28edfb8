#pragma once
#include <utility>
#include <variant>

namespace core {

// Wynik albo błąd (enum). Błędy ramkowania/dekodowania są oczekiwane,
// więc nie rzucamy wyjątków – wołający sprawdza ok().
template <typename T, typename E>
class Result {
public:
  Result(T value) : v_(std::in_place_index<0>, std::move(value)) {}
  Result(E error) : v_(std::in_place_index<1>, error) {}

  bool ok() const { return v_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<0>(v_); }
  T&       value()       { return std::get<0>(v_); }
  E        error() const { return std::get<1>(v_); }

private:
  std::variant<T, E> v_;
};

} // namespace core
