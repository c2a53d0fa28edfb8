#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace ui {

// Jednolity typ komendy dla CLI → głównego wątku
struct Command {
  enum class Type {
    Help, Identity,
    SetParam, GetParam, Trigger,
    Raw, Wait, Clear,
    Quit
  } type{Type::Help};

  // Proste pola parametryczne – używamy w switchu
  int a{0}, b{0};
  std::vector<uint8_t> bytes;   // tylko dla Raw
};

// Minimalna, bezpieczna kolejka (CLI → main). Nie jest w hot-path.
class CommandQueue {
public:
  void push(const Command& cmd) {
    std::lock_guard<std::mutex> lg(mu_);
    q_.push_back(cmd);
  }
  // Zbierz wszystko, co jest, bez blokowania
  std::deque<Command> drain() {
    std::lock_guard<std::mutex> lg(mu_);
    std::deque<Command> out;
    out.swap(q_);
    return out;
  }
private:
  std::mutex mu_;
  std::deque<Command> q_;
};

// Pomoc: wypisz help
inline void print_help() {
  std::cout <<
    "Commands (numbers: decimal or 0x hex):\n"
    "  help                - show this help\n"
    "  identity            - send Identity Request (F0 7E 7F 06 01 F7)\n"
    "  set <param> <value> - SetParameter\n"
    "  get <param>         - GetParameter\n"
    "  trigger <action>    - TriggerAction (0x01 = log)\n"
    "  raw <hex> ...       - send raw bytes as one message (e.g. raw F0 7D 01 03 01 F7)\n"
    "  wait [ms]           - print replies arriving within ms (default 500)\n"
    "  clear               - drop pending replies\n"
    "  quit                - exit\n";
}

// Liczba dziesiętna albo 0x.. (bez ósemkowych: "010" to 10). Cały token musi pasować.
inline bool read_number(std::istringstream& iss, int& out) {
  std::string tok;
  if (!(iss >> tok)) return false;

  int base = 10;
  std::string digits = tok;
  if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) {
    base = 16;
    digits = tok.substr(2);
  }
  if (digits.empty() || digits.size() > 7) return false;

  int value = 0;
  for (char ch : digits) {
    int d = -1;
    if (ch >= '0' && ch <= '9') d = ch - '0';
    else if (base == 16 && ch >= 'a' && ch <= 'f') d = ch - 'a' + 10;
    else if (base == 16 && ch >= 'A' && ch <= 'F') d = ch - 'A' + 10;
    if (d < 0) return false;
    value = value * base + d;
  }
  out = value;
  return true;
}

inline bool read_byte(std::istringstream& iss, int& out) {
  return read_number(iss, out) && out >= 0 && out <= 0xFF;
}

// Sparsuj jedną linię; false = nieznana/niepełna komenda
inline bool parse_command(const std::string& line, Command& c) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return false;

  if      (cmd == "help")     { c.type = Command::Type::Help; }
  else if (cmd == "identity") { c.type = Command::Type::Identity; }
  else if (cmd == "set")      { c.type = Command::Type::SetParam; return read_byte(iss, c.a) && read_byte(iss, c.b); }
  else if (cmd == "get")      { c.type = Command::Type::GetParam; return read_byte(iss, c.a); }
  else if (cmd == "trigger")  { c.type = Command::Type::Trigger;  return read_byte(iss, c.a); }
  else if (cmd == "raw") {
    c.type = Command::Type::Raw;
    // bajty zawsze szesnastkowo: "raw F0 7D 01 03 01 F7"
    std::string tok;
    while (iss >> tok) {
      std::istringstream ts(tok);
      int v = -1;
      if (!(ts >> std::hex >> v) || !ts.eof() || v < 0 || v > 0xFF) return false;
      c.bytes.push_back(static_cast<uint8_t>(v));
    }
    return !c.bytes.empty();
  }
  else if (cmd == "wait")     { c.type = Command::Type::Wait; if (!read_number(iss, c.a)) c.a = 500; }
  else if (cmd == "clear")    { c.type = Command::Type::Clear; }
  else if (cmd == "quit" || cmd == "exit") { c.type = Command::Type::Quit; }
  else return false;
  return true;
}

// Wątek CLI – czyta stdin, zamienia na Command i wkłada do kolejki
inline std::thread start_cli(std::atomic<bool>& running, CommandQueue& cq) {
  return std::thread([&running, &cq](){
    print_help();
    std::string line;
    while (running.load() && std::getline(std::cin, line)) {
      if (line.find_first_not_of(" \t") == std::string::npos) continue;

      Command c;
      if (!parse_command(line, c)) {
        std::cout << "Unknown. Type 'help'.\n";
        continue;
      }
      cq.push(c);
      if (c.type == Command::Type::Quit) break;
    }
    running.store(false);
  });
}

} // namespace ui
