#if __has_include(<rtmidi/RtMidi.h>)
  #include <rtmidi/RtMidi.h>   // Homebrew (macOS)
#elif __has_include(<RtMidi.h>)
  #include <RtMidi.h>
#else
  #error "RtMidi header not found. Install rtmidi."
#endif

#include <memory>
#include <vector>
#include <iostream>
#include <optional>
#include <string>

#include "desktop/DesktopMidi.hpp"

// Wypisz porty i wybierz ten, którego nazwa zawiera `wanted`
static unsigned selectPort(RtMidi* dev, const char* label, const std::string& wanted) {
  unsigned n = dev->getPortCount();
  if (n == 0) {
    std::cerr << "[MIDI] Brak portów " << label << "\n";
    throw ports::TransportError(std::string("No MIDI ") + label + " ports found");
  }
  std::cerr << "[MIDI] Dostępne porty " << label << ":\n";
  for (unsigned i = 0; i < n; ++i) {
    std::string name = dev->getPortName(i);
    std::cerr << "  [" << i << "] " << name << "\n";
    if (name.find(wanted) != std::string::npos) {
      std::cerr << "[MIDI] Wybieram port " << i << " (" << name << ")\n";
      return i;
    }
  }
  throw ports::TransportError("No MIDI " + std::string(label) + " port matching '" + wanted + "'");
}

// Otwórz własny port wirtualny albo podłącz się do istniejącego
static void openPort(RtMidi* dev, const char* label, const desktop_midi::PortSpec& spec) {
  try {
    if (spec.virtual_port) {
      dev->openVirtualPort(spec.name);
      std::cerr << "[MIDI] Otwarty port wirtualny " << label << ": " << spec.name << "\n";
    } else {
      dev->openPort(selectPort(dev, label, spec.name), spec.name);
    }
  } catch (const RtMidiError& e) {
    throw ports::TransportError(std::string("Cannot open MIDI ") + label + " port '" + spec.name + "': " + e.getMessage());
  }
}

class DesktopMidiIn final : public ports::IMidiIn {
public:
  DesktopMidiIn(const ports::IClock& clock, const desktop_midi::PortSpec& spec)
    : clock_(clock), name_(spec.name) {
    try {
      in_ = std::make_unique<RtMidiIn>(RtMidi::UNSPECIFIED, "midiproxy");
    } catch (const RtMidiError& e) {
      throw ports::TransportError("RtMidiIn: " + e.getMessage());
    }
    in_->ignoreTypes(false, false, false);   // SysEx, timing i sensing też przepuszczamy
    openPort(in_.get(), "IN", spec);
  }

  ~DesktopMidiIn() override {
    if (in_->isPortOpen()) in_->closePort();
  }

  std::optional<ports::MidiMsg> poll() override {
    if (!in_->isPortOpen()) throw ports::TransportError("MIDI IN port '" + name_ + "' is closed");

    std::vector<unsigned char> msg;
    try {
      (void)in_->getMessage(&msg);     // non-blocking; msg=[] jeśli nic nie ma
    } catch (const RtMidiError& e) {
      throw ports::TransportError("MIDI IN '" + name_ + "': " + e.getMessage());
    }
    if (msg.empty()) return std::nullopt;

    ports::MidiMsg m{};
    m.bytes.assign(msg.begin(), msg.end());
    m.t_ms = clock_.now_ms();
    return m;
  }

private:
  const ports::IClock& clock_;
  std::string name_;
  std::unique_ptr<RtMidiIn> in_;
};

class DesktopMidiOut final : public ports::IMidiOut {
public:
  explicit DesktopMidiOut(const desktop_midi::PortSpec& spec) : name_(spec.name) {
    try {
      out_ = std::make_unique<RtMidiOut>(RtMidi::UNSPECIFIED, "midiproxy");
    } catch (const RtMidiError& e) {
      throw ports::TransportError("RtMidiOut: " + e.getMessage());
    }
    openPort(out_.get(), "OUT", spec);
  }

  ~DesktopMidiOut() override {
    if (out_->isPortOpen()) out_->closePort();
  }

  void send(const ports::MidiMsg& m) override {
    if (!out_->isPortOpen()) throw ports::TransportError("MIDI OUT port '" + name_ + "' is closed");
    std::vector<unsigned char> v(m.bytes.begin(), m.bytes.end());
    try {
      out_->sendMessage(&v);             // cała wiadomość naraz
    } catch (const RtMidiError& e) {
      throw ports::TransportError("MIDI OUT '" + name_ + "': " + e.getMessage());
    }
  }

private:
  std::string name_;
  std::unique_ptr<RtMidiOut> out_;
};

// Fabryki (jedyna definicja)
namespace desktop_midi {
  std::unique_ptr<ports::IMidiIn>  makeIn (const ports::IClock& clk, const PortSpec& spec) { return std::make_unique<DesktopMidiIn>(clk, spec); }
  std::unique_ptr<ports::IMidiOut> makeOut(const PortSpec& spec)                           { return std::make_unique<DesktopMidiOut>(spec); }
}
