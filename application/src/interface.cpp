#include "sauna_controller/interface.hpp"

#include "sauna_controller/register_codec/register_codec.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sauna_controller {

namespace {

// Diagnostics only; every other word is a control action, including "status".
const std::vector<std::string> kQueryCommands = {"show", "poll", "resolve", "discover", "map"};

std::string formatTime(std::chrono::system_clock::time_point tp) {
  const std::time_t sec = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf{};
  localtime_r(&sec, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%F %T");
  return oss.str();
}

template <typename T>
std::string optionalText(const std::optional<T>& value, const char* unit = "") {
  if (!value) return "n/a";
  std::ostringstream oss;
  oss << *value << unit;
  return oss.str();
}

std::string optionalTime(const std::optional<PackedTime>& value) {
  return value ? value->toString() : "n/a";
}

std::string formatSnapshot(const Snapshot& s) {
  std::ostringstream oss;
  oss << "available=" << (s.available ? "true" : "false")
      << " status=" << controllerStatusName(s.controller_status)
      << " temp=" << s.actual_temp << "C"
      << " set_temp=" << optionalText(s.set_temp, "C")
      << " profile=" << (s.profile ? profileName(*s.profile) : "n/a")
      << " session=" << optionalTime(s.session_time)
      << " ventilation=" << optionalTime(s.ventilation_time)
      << " humidity=" << s.humidity << "%"
      << " humidity_value=" << optionalText(s.humidity_value, "%")
      << " aroma=" << optionalText(s.aroma_value, "%")
      << " error_code=" << optionalText(s.error_code)
      << " light=" << (s.light ? "on" : "off")
      << " aux=" << (s.aux ? "on" : "off")
      << " model=" << s.controller_model;
  if (s.has_data) oss << " updated=\"" << formatTime(s.last_updated) << "\"";
  if (!s.last_error.empty()) oss << " last_error=\"" << s.last_error << "\"";
  return oss.str();
}

bool parseDouble(const std::string& text, double* out) {
  if (!out) return false;
  try {
    size_t idx = 0;
    *out = std::stod(text, &idx);
    return idx == text.size();
  } catch (const std::logic_error&) {
    return false;
  }
}

class FunctionDriverAdapter : public DriverAdapter {
 public:
  using StatusFn = std::function<Status()>;
  using QueryFn = std::function<Status(const std::vector<std::string>&)>;
  using CommandsFn = std::function<std::vector<std::string>()>;

  FunctionDriverAdapter(std::string driver_name,
                        StatusFn init_fn,
                        StatusFn start_fn,
                        StatusFn stop_fn,
                        QueryFn query_fn,
                        CommandsFn commands_fn)
      : name_(std::move(driver_name)),
        init_fn_(std::move(init_fn)),
        start_fn_(std::move(start_fn)),
        stop_fn_(std::move(stop_fn)),
        query_fn_(std::move(query_fn)),
        commands_fn_(std::move(commands_fn)) {}

  const std::string& name() const override { return name_; }
  Status init() override { return init_fn_ ? init_fn_() : okStatus(); }
  Status start() override { return start_fn_ ? start_fn_() : okStatus(); }
  Status stop() override { return stop_fn_ ? stop_fn_() : okStatus(); }
  Status query(const std::vector<std::string>& args) override {
    return query_fn_ ? query_fn_(args) : errorStatus(ErrorKind::kUnsupported, "query unsupported");
  }
  std::vector<std::string> availableCommands() const override {
    return commands_fn_ ? commands_fn_() : std::vector<std::string>{};
  }

 private:
  std::string name_;
  StatusFn init_fn_;
  StatusFn start_fn_;
  StatusFn stop_fn_;
  QueryFn query_fn_;
  CommandsFn commands_fn_;
};

}  // namespace

Interface::Interface() : initialized_(false), started_(false), config_loaded_(false) {
  device_defaults_.push_back(DeviceDefaults{});
}

Interface::~Interface() {
  if (started_) {
    for (auto it = drivers_.begin(); it != drivers_.end(); ++it) {
      const Status s = it->second->stop();
      if (!s.ok) std::cerr << "[sauna:" << it->first << "] stop failed: " << s.message << "\n";
    }
    started_ = false;
  }
}

const std::string& Interface::loadedConfigPath() const {
  return loaded_config_path_;
}

const std::vector<Interface::DeviceDefaults>& Interface::deviceDefaults() const {
  return device_defaults_;
}

std::string Interface::extractObjectBody(const std::string& json_text, const std::string& key) {
  const std::string marker = "\"" + key + "\"";
  const size_t key_pos = json_text.find(marker);
  if (key_pos == std::string::npos) return "";

  const size_t brace_pos = json_text.find('{', key_pos);
  if (brace_pos == std::string::npos) return "";

  int depth = 0;
  for (size_t i = brace_pos; i < json_text.size(); ++i) {
    if (json_text[i] == '{') ++depth;
    else if (json_text[i] == '}') --depth;
    if (depth == 0) {
      return json_text.substr(brace_pos + 1, i - brace_pos - 1);
    }
  }
  return "";
}

std::string Interface::extractArrayBody(const std::string& json_text, const std::string& key) {
  const std::string marker = "\"" + key + "\"";
  const size_t key_pos = json_text.find(marker);
  if (key_pos == std::string::npos) return "";

  const size_t bracket_pos = json_text.find('[', key_pos);
  if (bracket_pos == std::string::npos) return "";

  int depth = 0;
  for (size_t i = bracket_pos; i < json_text.size(); ++i) {
    if (json_text[i] == '[') ++depth;
    else if (json_text[i] == ']') --depth;
    if (depth == 0) {
      return json_text.substr(bracket_pos + 1, i - bracket_pos - 1);
    }
  }
  return "";
}

std::vector<std::string> Interface::splitTopLevelObjects(const std::string& array_body) {
  std::vector<std::string> out;
  int depth = 0;
  size_t start = std::string::npos;
  for (size_t i = 0; i < array_body.size(); ++i) {
    const char ch = array_body[i];
    if (ch == '{') {
      if (depth == 0) start = i;
      ++depth;
    } else if (ch == '}') {
      --depth;
      if (depth == 0 && start != std::string::npos) {
        out.push_back(array_body.substr(start + 1, i - start - 1));
        start = std::string::npos;
      }
    }
  }
  return out;
}

bool Interface::extractStringValue(const std::string& object_body, const std::string& key, std::string* out) {
  if (!out) return false;
  const std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(object_body, m, re)) return false;
  *out = m[1].str();
  return true;
}

bool Interface::extractIntValue(const std::string& object_body, const std::string& key, int* out) {
  if (!out) return false;
  const std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(object_body, m, re)) return false;
  return register_codec::parseInteger(m[1].str(), out).ok;
}

bool Interface::extractBoolValue(const std::string& object_body, const std::string& key, bool* out) {
  if (!out) return false;
  const std::regex re("\"" + key + "\"\\s*:\\s*(true|false|1|0)");
  std::smatch m;
  if (!std::regex_search(object_body, m, re)) return false;
  return register_codec::parseBool(m[1].str(), out).ok;
}

bool Interface::extractDoubleValue(const std::string& object_body, const std::string& key, double* out) {
  if (!out) return false;
  const std::regex re("\"" + key + "\"\\s*:\\s*(-?(?:[0-9]+(?:\\.[0-9]+)?|\\.[0-9]+))");
  std::smatch m;
  if (!std::regex_search(object_body, m, re)) return false;
  return parseDouble(m[1].str(), out);
}

Interface::DeviceDefaults Interface::parseDeviceObject(const std::string& body) {
  DeviceDefaults one;
  std::string id;
  if (extractStringValue(body, "id", &id) && !id.empty()) one.id = id;
  bool enable = true;
  if (extractBoolValue(body, "enable", &enable)) one.enable = enable;
  std::string host;
  if (extractStringValue(body, "host", &host)) one.host = host;
  int value = 0;
  if (extractIntValue(body, "port", &value)) one.port = value;
  if (extractIntValue(body, "unit_id", &value)) one.unit_id = value;
  if (extractIntValue(body, "scan_interval", &value)) {
    one.scan_interval = poll_coordinator::clampScanInterval(value);
  }
  if (extractIntValue(body, "resolve_failure_threshold", &value)) {
    one.resolve_failure_threshold = value;
  }
  if (extractIntValue(body, "io_gap_ms", &value)) one.io_gap_ms = value;
  if (extractIntValue(body, "light_register", &value)) one.light_register = value;
  if (extractIntValue(body, "aux_register", &value)) one.aux_register = value;
  if (extractIntValue(body, "controller_model", &value)) one.controller_model = value;
  double timeout_sec = 0.0;
  if (extractDoubleValue(body, "timeout_sec", &timeout_sec)) one.timeout_sec = timeout_sec;
  return one;
}

Status Interface::applySaunaDefaultsFromJson(const std::string& json_text) {
  const std::string runtime_body = extractObjectBody(json_text, "runtime");
  const std::string body = runtime_body.empty() ? "" : extractObjectBody(runtime_body, "sauna");
  if (body.empty()) {
    return errorStatus(ErrorKind::kConfig, "missing runtime.sauna section");
  }

  std::vector<DeviceDefaults> parsed;
  const std::string instances_body = extractArrayBody(body, "instances");
  if (!instances_body.empty()) {
    const std::vector<std::string> object_bodies = splitTopLevelObjects(instances_body);
    for (size_t i = 0; i < object_bodies.size(); ++i) {
      parsed.push_back(parseDeviceObject(object_bodies[i]));
    }
  } else {
    // Backward compatibility for legacy single-object configuration.
    parsed.push_back(parseDeviceObject(body));
  }

  std::set<std::string> ids;
  for (size_t i = 0; i < parsed.size(); ++i) {
    const DeviceDefaults& d = parsed[i];
    if (!ids.insert(d.id).second) {
      return errorStatus(ErrorKind::kConfig, "duplicate sauna id: " + d.id);
    }
    if (d.host.empty()) return errorStatus(ErrorKind::kConfig, d.id + ": empty host");
    if (d.port < 1 || d.port > 65535) {
      return errorStatus(ErrorKind::kConfig, d.id + ": port must be 1~65535");
    }
    if (d.unit_id < 0 || d.unit_id > 255) {
      return errorStatus(ErrorKind::kConfig, d.id + ": unit_id must be 0~255");
    }
    if (d.io_gap_ms < 0) return errorStatus(ErrorKind::kConfig, d.id + ": io_gap_ms must be >= 0");
    if (d.timeout_sec <= 0.0) {
      return errorStatus(ErrorKind::kConfig, d.id + ": timeout_sec must be positive");
    }
    if (d.light_register > 65535 || d.aux_register > 65535) {
      return errorStatus(ErrorKind::kConfig, d.id + ": light/aux register must be -1 or 0~65535");
    }
  }
  device_defaults_ = parsed;
  return okStatus();
}

Status Interface::loadConfig(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return errorStatus(ErrorKind::kConfig, "failed to open config file: " + path);
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();

  const Status s = applySaunaDefaultsFromJson(ss.str());
  if (!s.ok) return errorStatus(s.kind, path + ": " + s.message);

  config_loaded_ = true;
  loaded_config_path_ = path;
  std::string message = "config loaded: " + path;
  if (initialized_) message += " (applies on next init)";
  return okStatus(message);
}

Status Interface::loadDefaultConfigIfPresent() {
  if (config_loaded_) return okStatus("config already loaded");

  std::vector<std::string> candidates;
  const char* env_cfg = std::getenv("SC_CONFIG");
  if (env_cfg && env_cfg[0] != '\0') candidates.push_back(env_cfg);
  candidates.push_back("config/common_config.json");
  candidates.push_back("../config/common_config.json");
  candidates.push_back("../../config/common_config.json");

  for (const auto& path : candidates) {
    if (std::filesystem::exists(path)) {
      return loadConfig(path);
    }
  }
  return okStatus("default config not found, using builtin defaults");
}

void Interface::printLine(const std::string& prefix, const std::string& text) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << "[" << prefix << "] " << text << "\n";
}

std::unique_ptr<Interface::SaunaDevice> Interface::buildDevice(const DeviceDefaults& config) {
  std::unique_ptr<SaunaDevice> device = std::make_unique<SaunaDevice>();
  device->config = config;
  const std::string id = config.id;

  device->client = std::make_unique<modbus_tcp::ModbusTcpClient>(
      static_cast<uint8_t>(config.unit_id), config.timeout_sec);
  device->client->on_log.connect(
      [this, id](const std::string& text) { printLine("modbus_tcp:" + id, text); });

  device->resolver = std::make_unique<address_resolver::AddressResolver>(
      std::make_unique<address_resolver::SystemHostLookup>());
  device->resolver->on_log.connect(
      [this, id](const std::string& text) { printLine("resolver:" + id, text); });

  poll_coordinator::CoordinatorOptions options;
  options.host = config.host;
  options.port = static_cast<uint16_t>(config.port);
  options.scan_interval_sec = config.scan_interval;
  options.resolve_failure_threshold = config.resolve_failure_threshold;
  options.io_gap_ms = static_cast<uint32_t>(config.io_gap_ms);
  options.light_register = config.light_register;
  options.aux_register = config.aux_register;
  options.controller_model = config.controller_model;
  device->coordinator = std::make_unique<poll_coordinator::PollCoordinator>(
      options, *device->client, *device->resolver);
  device->coordinator->on_log.connect(
      [this, id](const std::string& text) { printLine("poll:" + id, text); });
  device->coordinator->on_snapshot.connect(
      [this, id](const Snapshot& s) { printLine("snapshot:" + id, formatSnapshot(s)); });

  command_dispatcher::DispatcherOptions dispatcher_options;
  dispatcher_options.device_key = device->coordinator->deviceKey();
  dispatcher_options.io_gap_ms = options.io_gap_ms;
  dispatcher_options.light_register = config.light_register;
  dispatcher_options.aux_register = config.aux_register;
  poll_coordinator::PollCoordinator* coordinator = device->coordinator.get();
  device->dispatcher = std::make_unique<command_dispatcher::CommandDispatcher>(
      dispatcher_options, *device->client, [coordinator]() { return coordinator->ensureAddress(); });
  device->dispatcher->on_log.connect(
      [this, id](const std::string& text) { printLine("command:" + id, text); });
  return device;
}

void Interface::buildDriverAdapters() {
  drivers_.clear();
  for (auto it = devices_.begin(); it != devices_.end(); ++it) {
    SaunaDevice* device = it->second.get();
    drivers_[it->first] = std::make_unique<FunctionDriverAdapter>(
        it->first,
        []() { return okStatus(); },
        [device]() { return device->coordinator->start(); },
        [device]() {
          const Status s = device->coordinator->stop();
          device->client->close();
          return s;
        },
        [this, device](const std::vector<std::string>& args) { return queryDevice(*device, args); },
        []() {
          std::vector<std::string> cmds = kQueryCommands;
          const std::vector<std::string> actions = command_dispatcher::actionNames();
          cmds.insert(cmds.end(), actions.begin(), actions.end());
          return cmds;
        });
  }
}

Status Interface::init() {
  if (initialized_) {
    return okStatus("sauna_controller already initialized");
  }

  const Status cfg_status = loadDefaultConfigIfPresent();
  if (!cfg_status.ok) return cfg_status;

  devices_.clear();
  for (size_t i = 0; i < device_defaults_.size(); ++i) {
    const DeviceDefaults& cfg = device_defaults_[i];
    if (!cfg.enable) continue;
    devices_[cfg.id] = buildDevice(cfg);
  }

  buildDriverAdapters();
  for (auto it = drivers_.begin(); it != drivers_.end(); ++it) {
    const Status s = it->second->init();
    if (!s.ok) return errorStatus(s.kind, "init failed on " + it->first + ": " + s.message);
  }

  initialized_ = true;
  std::string message = "sauna_controller initialized";
  if (!loaded_config_path_.empty()) message += " with config: " + loaded_config_path_;
  return okStatus(message);
}

Status Interface::start() {
  if (!initialized_) return errorStatus(ErrorKind::kConfig, "sauna_controller not initialized");
  if (started_) return okStatus("all devices already started");

  {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "[startup-summary] devices and poll plan\n";
    for (size_t i = 0; i < device_defaults_.size(); ++i) {
      const DeviceDefaults& d = device_defaults_[i];
      std::cout << "  - " << d.id << ": enabled=" << (d.enable ? "true" : "false")
                << ", host=" << d.host << ":" << d.port
                << ", scan_interval=" << d.scan_interval << "s\n";
    }
  }

  for (auto it = drivers_.begin(); it != drivers_.end(); ++it) {
    const Status s = it->second->start();
    if (!s.ok) return errorStatus(s.kind, "start failed on " + it->first + ": " + s.message);
  }
  started_ = true;
  return okStatus("all devices started");
}

Status Interface::stop() {
  if (!initialized_) return errorStatus(ErrorKind::kConfig, "sauna_controller not initialized");
  if (!started_) return okStatus("all devices already stopped");
  for (auto it = drivers_.begin(); it != drivers_.end(); ++it) {
    const Status s = it->second->stop();
    if (!s.ok) return errorStatus(s.kind, "stop failed on " + it->first + ": " + s.message);
  }
  started_ = false;
  return okStatus("all devices stopped");
}

Status Interface::query(const std::string& device, const std::vector<std::string>& args) {
  if (!initialized_) return errorStatus(ErrorKind::kConfig, "sauna_controller not initialized");
  auto it = drivers_.find(device);
  if (it == drivers_.end()) return errorStatus(ErrorKind::kConfig, "device not enabled or unknown device");
  return it->second->query(args);
}

Status Interface::queryDevice(SaunaDevice& device, const std::vector<std::string>& args) {
  if (args.empty()) return errorStatus(ErrorKind::kValidation, "missing command");
  const std::string& cmd = args[0];
  const std::string prefix = "sauna:" + device.config.id;

  if (cmd == "show") {
    const Snapshot s = device.coordinator->snapshot();
    const std::string address = device.coordinator->currentAddress();
    printLine(prefix, formatSnapshot(s));
    printLine(prefix, "host=" + device.config.host + " address=" + (address.empty() ? "n/a" : address) +
                          " consecutive_failures=" +
                          std::to_string(device.coordinator->consecutiveFailures()) +
                          " resolutions=" + std::to_string(device.coordinator->resolutionCount()) +
                          " polling=" + (device.coordinator->isRunning() ? "true" : "false"));
    return okStatus();
  }
  if (cmd == "poll") {
    const poll_coordinator::PollOutcome outcome = device.coordinator->pollOnce();
    const std::string name = poll_coordinator::pollOutcomeName(outcome);
    if (outcome == poll_coordinator::PollOutcome::kSkipped) {
      return errorStatus(ErrorKind::kBusy, "poll skipped: cycle already in flight");
    }
    if (outcome == poll_coordinator::PollOutcome::kDegraded) {
      return errorStatus(ErrorKind::kTransport, "poll " + name + ": " +
                                                    device.coordinator->snapshot().last_error);
    }
    return okStatus("poll " + name);
  }
  if (cmd == "resolve") {
    address_resolver::ResolveResult result;
    const Status s = device.resolver->resolve(device.config.host, &result);
    if (!s.ok) return s;
    const char* source = result.literal ? "literal" : (result.from_cache ? "cache" : "live");
    printLine(prefix, device.config.host + " -> " + result.ip + " (" + source + ")");
    return okStatus();
  }
  if (cmd == "discover") {
    std::vector<std::string> candidates(args.begin() + 1, args.end());
    if (candidates.empty()) candidates = poll_coordinator::defaultDiscoveryCandidates();
    poll_coordinator::DiscoveryResult result;
    const Status s = device.coordinator->discover(candidates, &result);
    for (size_t i = 0; i < result.rejected.size(); ++i) {
      printLine(prefix, "skipped " + result.rejected[i]);
    }
    if (!s.ok) return s;
    printLine(prefix, "found controller at " + result.host + " (" + result.ip + "), status=" +
                          controllerStatusName(result.controller_status) +
                          " temp=" + std::to_string(result.actual_temp) + "C");
    return okStatus(result.host);
  }
  if (cmd == "map") {
    const std::vector<register_codec::RegisterEntry>& map = register_codec::registerMap();
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "[" << prefix << "] holding registers, unit " << device.config.unit_id
              << ", bulk read " << register_codec::bulkReadStart() << "+"
              << register_codec::bulkReadCount() << "\n";
    for (size_t i = 0; i < map.size(); ++i) {
      std::cout << "  " << std::setw(3) << map[i].address << "  " << std::left << std::setw(18)
                << map[i].name << std::right << " range " << map[i].min_value << "~"
                << map[i].max_value << (map[i].encode ? "  rw" : "  ro") << "\n";
    }
    if (device.config.light_register >= 0) {
      std::cout << "  " << std::setw(3) << device.config.light_register << "  light (configured)\n";
    }
    if (device.config.aux_register >= 0) {
      std::cout << "  " << std::setw(3) << device.config.aux_register << "  aux (configured)\n";
    }
    return okStatus();
  }
  return errorStatus(ErrorKind::kValidation, "unknown sauna command: " + cmd);
}

Status Interface::dispatchCommand(const std::string& device, const std::vector<std::string>& args) {
  if (!initialized_) return errorStatus(ErrorKind::kConfig, "sauna_controller not initialized");
  if (args.empty()) return errorStatus(ErrorKind::kValidation, "missing command");
  if (std::find(kQueryCommands.begin(), kQueryCommands.end(), args[0]) != kQueryCommands.end()) {
    return query(device, args);
  }

  SaunaDevice* target = findDevice(device);
  if (!target) return errorStatus(ErrorKind::kConfig, "device not enabled or unknown device");

  command_dispatcher::PendingCommand command;
  const Status parsed = command_dispatcher::CommandDispatcher::parseCommand(args, &command);
  if (!parsed.ok) return parsed;

  const command_dispatcher::DispatchResult result = target->dispatcher->dispatch(command);
  if (!result.status.ok) return result.status;

  // Refresh so the snapshot reflects the write without waiting a full interval.
  const poll_coordinator::PollOutcome refresh = target->coordinator->pollOnce();
  if (refresh != poll_coordinator::PollOutcome::kHealthy) {
    printLine("sauna:" + device, std::string("refresh after command: ") +
                                     poll_coordinator::pollOutcomeName(refresh));
  }
  return result.status;
}

Status Interface::snapshot(const std::string& device, Snapshot* out) const {
  if (!out) return errorStatus(ErrorKind::kValidation, "null output");
  const SaunaDevice* target = findDevice(device);
  if (!target) return errorStatus(ErrorKind::kConfig, "device not enabled or unknown device");
  *out = target->coordinator->snapshot();
  return okStatus();
}

std::vector<std::string> Interface::enabledDevices() const {
  std::vector<std::string> out;
  for (auto it = devices_.begin(); it != devices_.end(); ++it) out.push_back(it->first);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> Interface::availableCommands(const std::string& device) const {
  auto it = drivers_.find(device);
  if (it == drivers_.end()) return {};
  return it->second->availableCommands();
}

Interface::SaunaDevice* Interface::findDevice(const std::string& id) {
  auto it = devices_.find(id);
  return it == devices_.end() ? nullptr : it->second.get();
}

const Interface::SaunaDevice* Interface::findDevice(const std::string& id) const {
  auto it = devices_.find(id);
  return it == devices_.end() ? nullptr : it->second.get();
}

}  // namespace sauna_controller
