#pragma once

#include "modbus_tcp/modbus_tcp_client.hpp"
#include "sauna_controller/address_resolver/address_resolver.hpp"
#include "sauna_controller/command_dispatcher/command_dispatcher.hpp"
#include "sauna_controller/common/snapshot.hpp"
#include "sauna_controller/common/status.hpp"
#include "sauna_controller/poll_coordinator/poll_coordinator.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sauna_controller {

class DriverAdapter {
 public:
  virtual ~DriverAdapter() = default;
  virtual const std::string& name() const = 0;
  virtual Status init() = 0;
  virtual Status start() = 0;
  virtual Status stop() = 0;
  virtual Status query(const std::vector<std::string>& args) = 0;
  virtual std::vector<std::string> availableCommands() const = 0;
};

class Interface {
 public:
  struct DeviceDefaults {
    std::string id = "default";
    bool enable = true;
    std::string host = "ffes.local";
    int port = 502;
    int unit_id = 1;
    int scan_interval = poll_coordinator::kDefaultScanIntervalSec;
    int resolve_failure_threshold = poll_coordinator::kDefaultResolveFailureThreshold;
    int io_gap_ms = 120;
    double timeout_sec = 10.0;
    int light_register = -1;
    int aux_register = -1;
    int controller_model = 2;
  };

  Interface();
  ~Interface();

  Interface(const Interface&) = delete;
  Interface& operator=(const Interface&) = delete;

  // Replaces the device list. Devices already built keep running with their
  // old settings until the next init().
  Status loadConfig(const std::string& path);
  const std::string& loadedConfigPath() const;
  const std::vector<DeviceDefaults>& deviceDefaults() const;

  Status init();
  Status start();
  Status stop();

  // Diagnostics: show | poll | resolve | discover [host...] | map
  Status query(const std::string& device, const std::vector<std::string>& args);
  // Diagnostics or one of the control actions.
  Status dispatchCommand(const std::string& device, const std::vector<std::string>& args);
  Status snapshot(const std::string& device, Snapshot* out) const;
  std::vector<std::string> enabledDevices() const;
  std::vector<std::string> availableCommands(const std::string& device) const;

 private:
  // Declaration order matters: the coordinator stops its thread before the
  // client and resolver it borrows are destroyed.
  struct SaunaDevice {
    DeviceDefaults config;
    std::unique_ptr<modbus_tcp::ModbusTcpClient> client;
    std::unique_ptr<address_resolver::AddressResolver> resolver;
    std::unique_ptr<poll_coordinator::PollCoordinator> coordinator;
    std::unique_ptr<command_dispatcher::CommandDispatcher> dispatcher;
  };

  Status loadDefaultConfigIfPresent();
  static std::string extractObjectBody(const std::string& json_text, const std::string& key);
  static std::string extractArrayBody(const std::string& json_text, const std::string& key);
  static std::vector<std::string> splitTopLevelObjects(const std::string& array_body);
  static bool extractStringValue(const std::string& object_body, const std::string& key, std::string* out);
  static bool extractIntValue(const std::string& object_body, const std::string& key, int* out);
  static bool extractBoolValue(const std::string& object_body, const std::string& key, bool* out);
  static bool extractDoubleValue(const std::string& object_body, const std::string& key, double* out);
  static DeviceDefaults parseDeviceObject(const std::string& object_body);
  Status applySaunaDefaultsFromJson(const std::string& json_text);

  std::unique_ptr<SaunaDevice> buildDevice(const DeviceDefaults& config);
  void buildDriverAdapters();
  Status queryDevice(SaunaDevice& device, const std::vector<std::string>& args);
  SaunaDevice* findDevice(const std::string& id);
  const SaunaDevice* findDevice(const std::string& id) const;
  void printLine(const std::string& prefix, const std::string& text);

  bool initialized_;
  bool started_;
  bool config_loaded_;
  std::string loaded_config_path_;
  std::vector<DeviceDefaults> device_defaults_;
  // Outlives the devices whose log hooks print through it.
  mutable std::mutex output_mutex_;
  std::unordered_map<std::string, std::unique_ptr<SaunaDevice>> devices_;
  std::unordered_map<std::string, std::unique_ptr<DriverAdapter>> drivers_;
};

}  // namespace sauna_controller
