#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "core/Message.hpp"
#include "core/Result.hpp"

namespace core {

/*
 * ======================
 * 1) STAŁE PROTOKOŁU
 * ======================
 *
 * Identity Request: F0 7E 7F 06 01 F7
 * Identity Reply:   F0 7E 7F 06 02 7D 01 01 01 01 01 01 01 01 F7
 * Własne komendy:   F0 7D <DeviceId> <CommandId> <Payload...> F7
 */
namespace sysex {
constexpr uint8_t MANUFACTURER_ID          = 0x7D;  // non-commercial / educational
constexpr uint8_t UNIVERSAL_NON_REALTIME   = 0x7E;
constexpr uint8_t GENERAL_INFORMATION      = 0x06;  // sub-ID#1
constexpr uint8_t IDENTITY_REQUEST         = 0x01;  // sub-ID#2
constexpr uint8_t IDENTITY_REPLY           = 0x02;  // sub-ID#2
constexpr uint8_t ALL_CALL                 = 0x7F;  // "do wszystkich urządzeń"

constexpr uint8_t CMD_SET_PARAMETER  = 0x01;
constexpr uint8_t CMD_GET_PARAMETER  = 0x02;
constexpr uint8_t CMD_TRIGGER_ACTION = 0x03;
constexpr uint8_t CMD_ERROR_REPORT   = 0x7F;

constexpr std::size_t MIN_MESSAGE_SIZE = 6;

// family LSB/MSB, model LSB/MSB, version x4 – stałe wartości zastępcze
constexpr uint8_t IDENTITY_FIELDS[8] = {0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01};
} // namespace sysex

// Kody błędów w ErrorReport
enum class ErrorCode : uint8_t {
  UnknownCommand   = 0x01,
  InvalidParameter = 0x02,
  ActionFailed     = 0x03   // handler akcji zgłosił porażkę
};

/*
 * ======================
 * 2) MODEL KOMENDY
 * ======================
 */

// Typowany widok na SysEx. Dla 0x7E: sub_id = sub-ID#1, command_id = sub-ID#2.
// Dla 0x7D sub_id zawsze 0.
struct SysExCommand {
  uint8_t manufacturer_id{sysex::MANUFACTURER_ID};
  uint8_t device_id{0};
  uint8_t sub_id{0};
  uint8_t command_id{0};
  std::vector<uint8_t> payload;

  bool operator==(const SysExCommand& o) const {
    return manufacturer_id == o.manufacturer_id && device_id == o.device_id &&
           sub_id == o.sub_id && command_id == o.command_id && payload == o.payload;
  }
  bool operator!=(const SysExCommand& o) const { return !(*this == o); }
};

enum class CommandKind {
  IdentityRequest,
  IdentityReply,
  SetParameter,
  GetParameter,
  TriggerAction,
  ErrorReport,
  Unrecognized
};

enum class DecodeError {
  NotSysEx,
  TooShort,
  BadTerminator,
  InvalidDataByte,
  UnknownManufacturer
};

const char* to_string(CommandKind k);
const char* to_string(DecodeError e);
const char* to_string(ErrorCode c);

/*
 * ======================
 * 3) KODEK
 * ======================
 */

// Czyste i totalne na poprawnym SysEx; błąd jawnie przez DecodeError.
Result<SysExCommand, DecodeError> decode(const RawMessage& m);

// Odwrotność decode(). Rzuca std::invalid_argument dla komendy, której nie
// da się zakodować (bajt >= 0x80, obcy producent, 0x7D bez payloadu).
RawMessage encode(const SysExCommand& c);

// Tablica (manufacturer, command) -> rodzaj. Domyślnie Unrecognized.
CommandKind classify(const SysExCommand& c);

// Krótki opis do logów, np. "SetParameter device=01 param=02 value=40"
std::string summarize(const SysExCommand& c);

// Budowniczowie wiadomości z formatu na drucie
SysExCommand make_identity_request(uint8_t target = sysex::ALL_CALL);
SysExCommand make_identity_reply();
SysExCommand make_set_parameter(uint8_t device, uint8_t param, uint8_t value);
SysExCommand make_get_parameter(uint8_t device, uint8_t param);
SysExCommand make_get_parameter_reply(uint8_t device, uint8_t param, uint8_t value);
SysExCommand make_trigger_action(uint8_t device, uint8_t action);
SysExCommand make_error_report(uint8_t device, ErrorCode code, uint8_t original_command);

} // namespace core
