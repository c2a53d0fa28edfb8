#pragma once
#include <memory>
#include <string>
#include "ports/Midi.hpp"
#include "ports/Clock.hpp"

namespace desktop_midi {
  // virtual_port = true: utwórz własny port o nazwie `name`.
  // virtual_port = false: podłącz się do pierwszego portu, którego nazwa zawiera `name`.
  struct PortSpec {
    std::string name;
    bool virtual_port = true;
  };

  // Rzucają ports::TransportError, gdy portu nie da się otworzyć
  std::unique_ptr<ports::IMidiIn>  makeIn (const ports::IClock& clk, const PortSpec& spec);
  std::unique_ptr<ports::IMidiOut> makeOut(const PortSpec& spec);
}
