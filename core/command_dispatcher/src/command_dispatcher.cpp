#include "sauna_controller/command_dispatcher/command_dispatcher.hpp"

#include "sauna_controller/common/device_serial.hpp"
#include "sauna_controller/register_codec/register_codec.hpp"

#include <sstream>
#include <utility>

namespace sauna_controller {
namespace command_dispatcher {

namespace {

using register_codec::Field;

struct ActionName {
  ActionKind action;
  const char* name;
};

const ActionName kActionNames[] = {
    {ActionKind::kStatus, "status"},
    {ActionKind::kLight, "light"},
    {ActionKind::kAux, "aux"},
    {ActionKind::kStartSession, "start_session"},
    {ActionKind::kStopSession, "stop_session"},
    {ActionKind::kSetTemp, "set_temp"},
    {ActionKind::kSetProfile, "set_profile"},
};

// Validates one field and appends its write. `failed_step` names the field
// when validation fails.
Status planField(const char* step,
                 Field field,
                 int value,
                 std::vector<RegisterWrite>* plan,
                 std::string* failed_step) {
  const register_codec::RegisterEntry* entry = register_codec::findEntry(field);
  uint16_t raw = 0;
  Status s = register_codec::encodeField(field, value, &raw);
  if (!s.ok || !entry) {
    if (failed_step) *failed_step = step;
    return errorStatus(ErrorKind::kValidation, std::string(step) + ": " + s.message);
  }
  plan->push_back(RegisterWrite{step, entry->address, raw});
  return okStatus();
}

Status planDuration(const char* step,
                    Field field,
                    const std::string& text,
                    std::vector<RegisterWrite>* plan,
                    std::string* failed_step) {
  PackedTime time;
  const Status s = register_codec::parseDuration(text, &time);
  if (!s.ok) {
    if (failed_step) *failed_step = step;
    return errorStatus(ErrorKind::kValidation, std::string(step) + ": " + s.message);
  }
  return planField(step, field, time.packed(), plan, failed_step);
}

Status parseSessionArgument(const std::string& token, SessionParams* session) {
  const size_t eq = token.find('=');
  if (eq == std::string::npos || eq == 0) {
    return errorStatus(ErrorKind::kValidation, "expected key=value, got: " + token);
  }
  const std::string key = token.substr(0, eq);
  const std::string value = token.substr(eq + 1);
  if (key == "session_time") {
    session->session_time = value;
    return okStatus();
  }
  if (key == "ventilation_time") {
    session->ventilation_time = value;
    return okStatus();
  }
  int* target = nullptr;
  if (key == "profile") target = &session->profile;
  else if (key == "temperature") target = &session->temperature;
  else if (key == "aroma") target = &session->aroma;
  else if (key == "humidity") target = &session->humidity;
  if (!target) return errorStatus(ErrorKind::kValidation, "unknown session parameter: " + key);
  return register_codec::parseInteger(value, target);
}

}  // namespace

const char* actionName(ActionKind action) {
  for (const ActionName& entry : kActionNames) {
    if (entry.action == action) return entry.name;
  }
  return "unknown";
}

bool parseActionKind(const std::string& text, ActionKind* out) {
  for (const ActionName& entry : kActionNames) {
    if (text == entry.name) {
      if (out) *out = entry.action;
      return true;
    }
  }
  return false;
}

std::vector<std::string> actionNames() {
  std::vector<std::string> names;
  for (const ActionName& entry : kActionNames) names.push_back(entry.name);
  return names;
}

CommandDispatcher::CommandDispatcher(DispatcherOptions options,
                                     modbus_tcp::RegisterTransport& transport,
                                     PrepareFn prepare)
    : options_(std::move(options)), transport_(transport), prepare_(std::move(prepare)) {}

Status CommandDispatcher::planOutput(const char* name,
                                     int address,
                                     bool enabled,
                                     std::vector<RegisterWrite>* plan,
                                     std::string* failed_step) const {
  if (address < 0 || address > 0xFFFF) {
    if (failed_step) *failed_step = name;
    return errorStatus(ErrorKind::kUnsupported,
                       std::string(name) + " is not available via Modbus on this controller");
  }
  plan->push_back(RegisterWrite{name, static_cast<uint16_t>(address),
                                static_cast<uint16_t>(enabled ? 1 : 0)});
  return okStatus();
}

Status CommandDispatcher::planWrites(const PendingCommand& command,
                                     std::vector<RegisterWrite>* plan,
                                     std::string* failed_step) const {
  if (!plan) return errorStatus(ErrorKind::kValidation, "null output");
  plan->clear();
  Status s = okStatus();
  switch (command.action) {
    case ActionKind::kStatus:
      s = planField("status", Field::kControllerStatus, command.value, plan, failed_step);
      break;
    case ActionKind::kLight:
      s = planOutput("light", options_.light_register, command.enabled, plan, failed_step);
      break;
    case ActionKind::kAux:
      s = planOutput("aux", options_.aux_register, command.enabled, plan, failed_step);
      break;
    case ActionKind::kSetTemp:
      s = planField("temperature", Field::kSetTemp, command.value, plan, failed_step);
      break;
    case ActionKind::kSetProfile:
      s = planField("profile", Field::kProfile, command.value, plan, failed_step);
      break;
    case ActionKind::kStopSession:
      s = planField("status", Field::kControllerStatus,
                    static_cast<int>(ControllerStatus::kOff), plan, failed_step);
      break;
    case ActionKind::kStartSession: {
      const SessionParams& p = command.session;
      s = planField("profile", Field::kProfile, p.profile, plan, failed_step);
      if (s.ok) s = planField("temperature", Field::kSetTemp, p.temperature, plan, failed_step);
      if (s.ok) {
        s = planDuration("session_time", Field::kSessionTime, p.session_time, plan, failed_step);
      }
      if (s.ok) {
        s = planDuration("ventilation_time", Field::kVentilationTime, p.ventilation_time, plan,
                         failed_step);
      }
      if (s.ok) s = planField("aroma", Field::kAromaValue, p.aroma, plan, failed_step);
      if (s.ok) s = planField("humidity", Field::kHumidityValue, p.humidity, plan, failed_step);
      // Heating starts only after every parameter is in place.
      if (s.ok) {
        s = planField("status", Field::kControllerStatus,
                      static_cast<int>(ControllerStatus::kHeating), plan, failed_step);
      }
      break;
    }
  }
  if (!s.ok) plan->clear();
  return s;
}

DispatchResult CommandDispatcher::dispatch(const PendingCommand& command) {
  DispatchResult result;
  const std::string action = actionName(command.action);
  result.status = planWrites(command, &result.plan, &result.failed_step);
  if (!result.status.ok) {
    emitLog("❌ " + action + " rejected: " + result.status.message);
    return result;
  }

  if (prepare_) {
    const Status s = prepare_();
    if (!s.ok) {
      result.failed_step = "resolve";
      result.status = s;
      emitLog("❌ " + action + " aborted before any write: " + s.message);
      return result;
    }
  }

  {
    common::DeviceSerialGuard guard(options_.device_key, options_.io_gap_ms);
    for (const RegisterWrite& write : result.plan) {
      const Status s = transport_.writeRegister(write.address, write.value);
      if (!s.ok) {
        result.failed_step = write.step;
        std::ostringstream oss;
        oss << action << " failed at " << write.step << " (register " << write.address
            << ") after " << result.writes_applied << " of " << result.plan.size()
            << " writes: " << s.message;
        result.status = errorStatus(s.kind, oss.str());
        break;
      }
      ++result.writes_applied;
    }
  }
  if (!result.status.ok) {
    emitLog("❌ " + result.status.message);
    return result;
  }

  result.status = okStatus(action + " applied (" + std::to_string(result.writes_applied) +
                           " register write" + (result.writes_applied == 1 ? "" : "s") + ")");
  emitLog("✅ " + result.status.message);
  return result;
}

Status CommandDispatcher::parseCommand(const std::vector<std::string>& args, PendingCommand* out) {
  if (!out) return errorStatus(ErrorKind::kValidation, "null output");
  if (args.empty()) return errorStatus(ErrorKind::kValidation, "missing action");

  PendingCommand command;
  if (!parseActionKind(args[0], &command.action)) {
    return errorStatus(ErrorKind::kValidation, "unknown action: " + args[0]);
  }

  switch (command.action) {
    case ActionKind::kStopSession:
      if (args.size() != 1) {
        return errorStatus(ErrorKind::kValidation, "stop_session takes no arguments");
      }
      break;
    case ActionKind::kLight:
    case ActionKind::kAux: {
      if (args.size() != 2) {
        return errorStatus(ErrorKind::kValidation, args[0] + " requires on|off");
      }
      const Status s = register_codec::parseBool(args[1], &command.enabled);
      if (!s.ok) return s;
      break;
    }
    case ActionKind::kStatus:
    case ActionKind::kSetTemp:
    case ActionKind::kSetProfile: {
      if (args.size() != 2) {
        return errorStatus(ErrorKind::kValidation, args[0] + " requires one integer value");
      }
      const Status s = register_codec::parseInteger(args[1], &command.value);
      if (!s.ok) return s;
      break;
    }
    case ActionKind::kStartSession:
      for (size_t i = 1; i < args.size(); ++i) {
        const Status s = parseSessionArgument(args[i], &command.session);
        if (!s.ok) return s;
      }
      break;
  }
  *out = command;
  return okStatus();
}

void CommandDispatcher::emitLog(const std::string& text) {
  on_log(text);
}

}  // namespace command_dispatcher
}  // namespace sauna_controller
