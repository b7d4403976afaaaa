#pragma once

#include "modbus_tcp/register_transport.hpp"
#include "sauna_controller/common/status.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <boost/signals2.hpp>

namespace sauna_controller {
namespace command_dispatcher {

enum class ActionKind {
  kStatus,
  kLight,
  kAux,
  kStartSession,
  kStopSession,
  kSetTemp,
  kSetProfile,
};

const char* actionName(ActionKind action);
bool parseActionKind(const std::string& text, ActionKind* out);
std::vector<std::string> actionNames();

struct SessionParams {
  int profile = 2;
  int temperature = 80;
  std::string session_time = "01:00";
  std::string ventilation_time = "00:15";
  int aroma = 0;
  int humidity = 0;
};

// One requested action. Consumed by exactly one dispatch() call and never
// retried by the dispatcher.
struct PendingCommand {
  ActionKind action = ActionKind::kStatus;
  int value = 0;
  bool enabled = false;
  SessionParams session;
};

struct RegisterWrite {
  std::string step;
  uint16_t address = 0;
  uint16_t value = 0;
};

struct DispatchResult {
  Status status;
  // Name of the step that failed validation or I/O; empty on success.
  std::string failed_step;
  size_t writes_applied = 0;
  std::vector<RegisterWrite> plan;
};

struct DispatcherOptions {
  std::string device_key;
  uint32_t io_gap_ms = 120;
  int light_register = -1;
  int aux_register = -1;
};

class CommandDispatcher {
 public:
  // Runs before any write to make sure the transport has a device address.
  using PrepareFn = std::function<Status()>;

  CommandDispatcher(DispatcherOptions options,
                    modbus_tcp::RegisterTransport& transport,
                    PrepareFn prepare = PrepareFn());

  boost::signals2::signal<void(const std::string&)> on_log;

  // Validates the whole command first, then issues the writes in order while
  // holding the device lock. A mid-sequence failure is reported with the
  // failed step and the number of writes already applied; nothing is rolled
  // back.
  DispatchResult dispatch(const PendingCommand& command);

  Status planWrites(const PendingCommand& command,
                    std::vector<RegisterWrite>* plan,
                    std::string* failed_step) const;

  // "status 1", "light on", "set_temp 80",
  // "start_session profile=1 temperature=80 session_time=01:30 ..."
  static Status parseCommand(const std::vector<std::string>& args, PendingCommand* out);

 private:
  Status planOutput(const char* name, int address, bool enabled, std::vector<RegisterWrite>* plan,
                    std::string* failed_step) const;
  void emitLog(const std::string& text);

  DispatcherOptions options_;
  modbus_tcp::RegisterTransport& transport_;
  PrepareFn prepare_;
};

}  // namespace command_dispatcher
}  // namespace sauna_controller
