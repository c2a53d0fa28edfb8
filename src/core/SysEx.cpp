#include "core/SysEx.hpp"

#include <iterator>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

std::string hex2(uint8_t v) { return to_hex({v}); }

void require_data_byte(uint8_t v, const char* field) {
  if (is_status_byte(v))
    throw std::invalid_argument(std::string("SysEx ") + field + " is not a data byte: " + hex2(v));
}

SysExCommand manufacturer_command(uint8_t device, uint8_t command, std::vector<uint8_t> payload) {
  SysExCommand c;
  c.manufacturer_id = sysex::MANUFACTURER_ID;
  c.device_id       = device;
  c.command_id      = command;
  c.payload         = std::move(payload);
  return c;
}

} // namespace

const char* to_string(CommandKind k) {
  switch (k) {
    case CommandKind::IdentityRequest: return "IdentityRequest";
    case CommandKind::IdentityReply:   return "IdentityReply";
    case CommandKind::SetParameter:    return "SetParameter";
    case CommandKind::GetParameter:    return "GetParameter";
    case CommandKind::TriggerAction:   return "TriggerAction";
    case CommandKind::ErrorReport:     return "ErrorReport";
    case CommandKind::Unrecognized:    return "Unrecognized";
  }
  return "?";
}

const char* to_string(DecodeError e) {
  switch (e) {
    case DecodeError::NotSysEx:            return "NotSysEx";
    case DecodeError::TooShort:            return "TooShort";
    case DecodeError::BadTerminator:       return "BadTerminator";
    case DecodeError::InvalidDataByte:     return "InvalidDataByte";
    case DecodeError::UnknownManufacturer: return "UnknownManufacturer";
  }
  return "?";
}

const char* to_string(ErrorCode c) {
  switch (c) {
    case ErrorCode::UnknownCommand:   return "UnknownCommand";
    case ErrorCode::InvalidParameter: return "InvalidParameter";
    case ErrorCode::ActionFailed:     return "ActionFailed";
  }
  return "?";
}

Result<SysExCommand, DecodeError> decode(const RawMessage& m) {
  const auto& b = m.bytes();
  if (b.empty() || b.front() != SYSEX_START) return DecodeError::NotSysEx;
  if (b.size() < sysex::MIN_MESSAGE_SIZE)    return DecodeError::TooShort;
  if (b.back() != SYSEX_END)                 return DecodeError::BadTerminator;
  for (std::size_t i = 1; i + 1 < b.size(); ++i)
    if (is_status_byte(b[i])) return DecodeError::InvalidDataByte;

  SysExCommand c;
  c.manufacturer_id = b[1];
  c.device_id       = b[2];
  const auto end = b.end() - 1;  // bez F7

  switch (b[1]) {
    case sysex::MANUFACTURER_ID:
      // F0 7D <dev> <cmd> <payload...> F7
      c.command_id = b[3];
      c.payload.assign(b.begin() + 4, end);
      return c;
    case sysex::UNIVERSAL_NON_REALTIME:
      // F0 7E <dev> <sub1> <sub2> <dane...> F7
      c.sub_id     = b[3];
      c.command_id = b[4];
      c.payload.assign(b.begin() + 5, end);
      return c;
    default:
      return DecodeError::UnknownManufacturer;
  }
}

RawMessage encode(const SysExCommand& c) {
  require_data_byte(c.device_id, "device id");
  require_data_byte(c.command_id, "command id");
  for (uint8_t v : c.payload) require_data_byte(v, "payload byte");

  std::vector<uint8_t> out;
  out.reserve(c.payload.size() + 6);
  out.push_back(SYSEX_START);
  out.push_back(c.manufacturer_id);
  out.push_back(c.device_id);

  switch (c.manufacturer_id) {
    case sysex::MANUFACTURER_ID:
      if (c.sub_id != 0)
        throw std::invalid_argument("SysEx sub id is only valid for universal messages");
      if (c.payload.empty())
        throw std::invalid_argument("SysEx manufacturer command needs at least one payload byte");
      break;
    case sysex::UNIVERSAL_NON_REALTIME:
      require_data_byte(c.sub_id, "sub id");
      out.push_back(c.sub_id);
      break;
    default:
      throw std::invalid_argument("SysEx manufacturer id not supported: " + hex2(c.manufacturer_id));
  }

  out.push_back(c.command_id);
  out.insert(out.end(), c.payload.begin(), c.payload.end());
  out.push_back(SYSEX_END);
  return RawMessage{std::move(out)};
}

CommandKind classify(const SysExCommand& c) {
  if (c.manufacturer_id == sysex::UNIVERSAL_NON_REALTIME) {
    if (c.sub_id != sysex::GENERAL_INFORMATION) return CommandKind::Unrecognized;
    switch (c.command_id) {
      case sysex::IDENTITY_REQUEST: return CommandKind::IdentityRequest;
      case sysex::IDENTITY_REPLY:   return CommandKind::IdentityReply;
      default:                      return CommandKind::Unrecognized;
    }
  }
  if (c.manufacturer_id == sysex::MANUFACTURER_ID) {
    switch (c.command_id) {
      case sysex::CMD_SET_PARAMETER:  return CommandKind::SetParameter;
      case sysex::CMD_GET_PARAMETER:  return CommandKind::GetParameter;
      case sysex::CMD_TRIGGER_ACTION: return CommandKind::TriggerAction;
      case sysex::CMD_ERROR_REPORT:   return CommandKind::ErrorReport;
      default:                        return CommandKind::Unrecognized;
    }
  }
  return CommandKind::Unrecognized;
}

std::string summarize(const SysExCommand& c) {
  const auto& p = c.payload;
  std::ostringstream os;
  const CommandKind kind = classify(c);
  os << to_string(kind);

  switch (kind) {
    case CommandKind::IdentityRequest:
      os << " target=" << hex2(c.device_id);
      break;
    case CommandKind::IdentityReply:
      if (!p.empty()) os << " manufacturer=" << hex2(p[0]);
      if (p.size() >= 9) {
        os << " family=" << to_hex({p[1], p[2]})
           << " model=" << to_hex({p[3], p[4]})
           << " version=" << to_hex({p[5], p[6], p[7], p[8]});
      }
      break;
    case CommandKind::SetParameter:
    case CommandKind::GetParameter:
      os << " device=" << hex2(c.device_id);
      if (p.size() >= 1) os << " param=" << hex2(p[0]);
      if (p.size() >= 2) os << " value=" << hex2(p[1]);
      break;
    case CommandKind::TriggerAction:
      os << " device=" << hex2(c.device_id);
      if (!p.empty()) os << " action=" << hex2(p[0]);
      break;
    case CommandKind::ErrorReport:
      os << " device=" << hex2(c.device_id);
      if (p.size() >= 1) {
        const auto code = static_cast<ErrorCode>(p[0]);
        const char* name = to_string(code);
        os << " code=" << (name[0] == '?' ? hex2(p[0]) : std::string(name));
      }
      if (p.size() >= 2) os << " command=" << hex2(p[1]);
      break;
    case CommandKind::Unrecognized:
      os << " manufacturer=" << hex2(c.manufacturer_id) << " command=" << hex2(c.command_id);
      break;
  }
  return os.str();
}

SysExCommand make_identity_request(uint8_t target) {
  SysExCommand c;
  c.manufacturer_id = sysex::UNIVERSAL_NON_REALTIME;
  c.device_id       = target;
  c.sub_id          = sysex::GENERAL_INFORMATION;
  c.command_id      = sysex::IDENTITY_REQUEST;
  return c;
}

SysExCommand make_identity_reply() {
  SysExCommand c;
  c.manufacturer_id = sysex::UNIVERSAL_NON_REALTIME;
  c.device_id       = sysex::ALL_CALL;  // odpowiedź zawsze w kontekście all-call
  c.sub_id          = sysex::GENERAL_INFORMATION;
  c.command_id      = sysex::IDENTITY_REPLY;
  c.payload.push_back(sysex::MANUFACTURER_ID);
  c.payload.insert(c.payload.end(), std::begin(sysex::IDENTITY_FIELDS), std::end(sysex::IDENTITY_FIELDS));
  return c;
}

SysExCommand make_set_parameter(uint8_t device, uint8_t param, uint8_t value) {
  return manufacturer_command(device, sysex::CMD_SET_PARAMETER, {param, value});
}

SysExCommand make_get_parameter(uint8_t device, uint8_t param) {
  return manufacturer_command(device, sysex::CMD_GET_PARAMETER, {param});
}

SysExCommand make_get_parameter_reply(uint8_t device, uint8_t param, uint8_t value) {
  return manufacturer_command(device, sysex::CMD_GET_PARAMETER, {param, value});
}

SysExCommand make_trigger_action(uint8_t device, uint8_t action) {
  return manufacturer_command(device, sysex::CMD_TRIGGER_ACTION, {action});
}

SysExCommand make_error_report(uint8_t device, ErrorCode code, uint8_t original_command) {
  return manufacturer_command(device, sysex::CMD_ERROR_REPORT,
                              {static_cast<uint8_t>(code), static_cast<uint8_t>(original_command & 0x7F)});
}

} // namespace core
