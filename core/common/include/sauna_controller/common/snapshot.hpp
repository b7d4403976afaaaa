#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sauna_controller {

enum class ControllerStatus {
  kOff = 0,
  kHeating = 1,
  kVentilation = 2,
  kStandby = 3,
  kUnknown = -1,
};

enum class SaunaProfile {
  kInfrared = 1,
  kDry = 2,
  kWet = 3,
  kVentilation = 4,
  kSteambath = 5,
  kInfraredCpir = 6,
  kInfraredMix = 7,
  kUnknown = -1,
};

// Duration packed as HH*100 + MM on the wire.
struct PackedTime {
  int hours = 0;
  int minutes = 0;

  int packed() const { return hours * 100 + minutes; }
  std::string toString() const;

  bool operator==(const PackedTime& other) const {
    return hours == other.hours && minutes == other.minutes;
  }
  bool operator!=(const PackedTime& other) const { return !(*this == other); }
};

struct Snapshot {
  ControllerStatus controller_status = ControllerStatus::kOff;
  bool light = false;
  bool aux = false;
  int controller_model = 2;
  int actual_temp = 0;
  int humidity = 0;
  std::optional<int> set_temp;
  std::optional<SaunaProfile> profile;
  std::optional<PackedTime> session_time;
  std::optional<PackedTime> ventilation_time;
  std::optional<int> aroma_value;
  std::optional<int> humidity_value;
  std::optional<int> error_code;
  std::chrono::system_clock::time_point last_updated;
  // Never cleared on failure; false only flags the values as stale.
  bool available = false;
  bool has_data = false;
  std::string last_error;
};

const char* controllerStatusName(ControllerStatus status);
const char* profileName(SaunaProfile profile);

}  // namespace sauna_controller
