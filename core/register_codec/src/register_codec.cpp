#include "sauna_controller/register_codec/register_codec.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sauna_controller {

std::string PackedTime::toString() const {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << hours << ":" << std::setw(2) << minutes;
  return oss.str();
}

const char* controllerStatusName(ControllerStatus status) {
  switch (status) {
    case ControllerStatus::kOff: return "off";
    case ControllerStatus::kHeating: return "heat";
    case ControllerStatus::kVentilation: return "fan_only";
    case ControllerStatus::kStandby: return "auto";
    case ControllerStatus::kUnknown: break;
  }
  return "unknown";
}

const char* profileName(SaunaProfile profile) {
  switch (profile) {
    case SaunaProfile::kInfrared: return "Infrared Sauna";
    case SaunaProfile::kDry: return "Dry Sauna";
    case SaunaProfile::kWet: return "Wet Sauna";
    case SaunaProfile::kVentilation: return "Ventilation";
    case SaunaProfile::kSteambath: return "Steambath";
    case SaunaProfile::kInfraredCpir: return "Infrared CPIR";
    case SaunaProfile::kInfraredMix: return "Infrared MIX";
    case SaunaProfile::kUnknown: break;
  }
  return "Unknown";
}

namespace register_codec {

namespace {

int16_t toSigned16(uint16_t value) {
  return static_cast<int16_t>(value);
}

bool inPercentRange(int value) {
  return value >= kMinPercent && value <= kMaxPercent;
}

bool decodeSetTemp(uint16_t raw, Snapshot* out) {
  out->set_temp = decodeTemperature(raw);
  return true;
}

bool decodeActualTemp(uint16_t raw, Snapshot* out) {
  out->actual_temp = decodeTemperature(raw);
  return true;
}

bool decodeProfileField(uint16_t raw, Snapshot* out) {
  const SaunaProfile profile = decodeProfile(raw);
  if (profile == SaunaProfile::kUnknown) return false;
  out->profile = profile;
  return true;
}

bool decodeSessionTime(uint16_t raw, Snapshot* out) {
  PackedTime t;
  if (!decodePackedTime(raw, &t)) return false;
  out->session_time = t;
  return true;
}

bool decodeVentilationTime(uint16_t raw, Snapshot* out) {
  PackedTime t;
  if (!decodePackedTime(raw, &t)) return false;
  out->ventilation_time = t;
  return true;
}

bool decodeAroma(uint16_t raw, Snapshot* out) {
  if (!inPercentRange(raw)) return false;
  out->aroma_value = raw;
  return true;
}

bool decodeHumidityValue(uint16_t raw, Snapshot* out) {
  if (!inPercentRange(raw)) return false;
  out->humidity_value = raw;
  return true;
}

bool decodeErrorCode(uint16_t raw, Snapshot* out) {
  out->error_code = raw;
  return true;
}

bool decodeHumidity(uint16_t raw, Snapshot* out) {
  if (!inPercentRange(raw)) return false;
  out->humidity = raw;
  return true;
}

bool decodeStatusField(uint16_t raw, Snapshot* out) {
  const ControllerStatus status = decodeStatus(raw);
  if (status == ControllerStatus::kUnknown) return false;
  out->controller_status = status;
  return true;
}

Status rangeError(const char* what, int value, int min_value, int max_value) {
  std::ostringstream oss;
  oss << what << " " << value << " out of range " << min_value << "~" << max_value;
  return errorStatus(ErrorKind::kValidation, oss.str());
}

std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

}  // namespace

const std::vector<RegisterEntry>& registerMap() {
  static const std::vector<RegisterEntry> kMap = {
      {Field::kSetTemp, "set_temp", 1, kMinTemperature, kMaxTemperature, decodeSetTemp,
       encodeTemperature},
      {Field::kActualTemp, "actual_temp", 2, -40, 150, decodeActualTemp, nullptr},
      {Field::kProfile, "profile", 4, 1, 7, decodeProfileField, encodeProfile},
      {Field::kSessionTime, "session_time", 5, 0, kMaxPackedHours * 100 + 59, decodeSessionTime,
       encodePackedTime},
      {Field::kVentilationTime, "ventilation_time", 6, 0, kMaxPackedHours * 100 + 59,
       decodeVentilationTime, encodePackedTime},
      {Field::kAromaValue, "aroma", 9, kMinPercent, kMaxPercent, decodeAroma, encodePercent},
      {Field::kHumidityValue, "humidity_value", 10, kMinPercent, kMaxPercent, decodeHumidityValue,
       encodePercent},
      {Field::kErrorCode, "error_code", 11, 0, 0xFFFF, decodeErrorCode, nullptr},
      {Field::kHumidity, "humidity", 15, kMinPercent, kMaxPercent, decodeHumidity, nullptr},
      {Field::kControllerStatus, "status", 20, 0, 3, decodeStatusField, encodeStatus},
  };
  return kMap;
}

const RegisterEntry* findEntry(Field field) {
  const std::vector<RegisterEntry>& map = registerMap();
  for (size_t i = 0; i < map.size(); ++i) {
    if (map[i].field == field) return &map[i];
  }
  return nullptr;
}

const RegisterEntry* findEntry(const std::string& name) {
  const std::vector<RegisterEntry>& map = registerMap();
  for (size_t i = 0; i < map.size(); ++i) {
    if (name == map[i].name) return &map[i];
  }
  return nullptr;
}

uint16_t bulkReadStart() {
  const std::vector<RegisterEntry>& map = registerMap();
  uint16_t lo = map.front().address;
  for (size_t i = 1; i < map.size(); ++i) lo = std::min(lo, map[i].address);
  return lo;
}

uint16_t bulkReadCount() {
  const std::vector<RegisterEntry>& map = registerMap();
  uint16_t hi = map.front().address;
  for (size_t i = 1; i < map.size(); ++i) hi = std::max(hi, map[i].address);
  return static_cast<uint16_t>(hi - bulkReadStart() + 1);
}

Status encodeTemperature(int celsius, uint16_t* raw) {
  if (!raw) return errorStatus(ErrorKind::kValidation, "null output");
  if (celsius < kMinTemperature || celsius > kMaxTemperature) {
    return rangeError("temperature", celsius, kMinTemperature, kMaxTemperature);
  }
  *raw = static_cast<uint16_t>(std::clamp(celsius, kMinTemperature, kMaxTemperature));
  return okStatus();
}

Status encodePercent(int percent, uint16_t* raw) {
  if (!raw) return errorStatus(ErrorKind::kValidation, "null output");
  if (!inPercentRange(percent)) return rangeError("percentage", percent, kMinPercent, kMaxPercent);
  *raw = static_cast<uint16_t>(std::clamp(percent, kMinPercent, kMaxPercent));
  return okStatus();
}

Status encodePackedTime(int packed, uint16_t* raw) {
  if (!raw) return errorStatus(ErrorKind::kValidation, "null output");
  if (packed < 0 || packed / 100 > kMaxPackedHours) {
    return rangeError("packed time", packed, 0, kMaxPackedHours * 100 + 59);
  }
  if (packed % 100 >= 60) {
    return errorStatus(ErrorKind::kValidation,
                       "packed time " + std::to_string(packed) + " has minutes >= 60");
  }
  *raw = static_cast<uint16_t>(packed);
  return okStatus();
}

Status encodeStatus(int status, uint16_t* raw) {
  if (!raw) return errorStatus(ErrorKind::kValidation, "null output");
  if (status < 0 || status > 3) return rangeError("status", status, 0, 3);
  *raw = static_cast<uint16_t>(status);
  return okStatus();
}

Status encodeProfile(int profile, uint16_t* raw) {
  if (!raw) return errorStatus(ErrorKind::kValidation, "null output");
  if (profile < 1 || profile > 7) return rangeError("profile", profile, 1, 7);
  *raw = static_cast<uint16_t>(profile);
  return okStatus();
}

Status encodeField(Field field, int value, uint16_t* raw) {
  const RegisterEntry* entry = findEntry(field);
  if (!entry) return errorStatus(ErrorKind::kValidation, "unmapped field");
  if (!entry->encode) {
    return errorStatus(ErrorKind::kValidation, std::string(entry->name) + " is read-only");
  }
  return entry->encode(value, raw);
}

bool decodePackedTime(uint16_t raw, PackedTime* out) {
  if (!out) return false;
  const int hours = raw / 100;
  const int minutes = raw % 100;
  if (minutes >= 60 || hours > kMaxPackedHours) return false;
  out->hours = hours;
  out->minutes = minutes;
  return true;
}

ControllerStatus decodeStatus(uint16_t raw) {
  if (raw > 3) return ControllerStatus::kUnknown;
  return static_cast<ControllerStatus>(raw);
}

SaunaProfile decodeProfile(uint16_t raw) {
  if (raw < 1 || raw > 7) return SaunaProfile::kUnknown;
  return static_cast<SaunaProfile>(raw);
}

int decodeTemperature(uint16_t raw) {
  return toSigned16(raw);
}

Status parseInteger(const std::string& text, int* out) {
  if (!out) return errorStatus(ErrorKind::kValidation, "null output");
  const std::string t = trim(text);
  try {
    size_t idx = 0;
    const int value = std::stoi(t, &idx, 10);
    if (idx != t.size()) return errorStatus(ErrorKind::kValidation, "not an integer: " + text);
    *out = value;
    return okStatus();
  } catch (const std::logic_error&) {
    return errorStatus(ErrorKind::kValidation, "not an integer: " + text);
  }
}

Status parseBool(const std::string& text, bool* out) {
  if (!out) return errorStatus(ErrorKind::kValidation, "null output");
  std::string t = trim(text);
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (t == "on" || t == "true" || t == "1") {
    *out = true;
    return okStatus();
  }
  if (t == "off" || t == "false" || t == "0") {
    *out = false;
    return okStatus();
  }
  return errorStatus(ErrorKind::kValidation, "not a boolean: " + text);
}

Status parseDuration(const std::string& text, PackedTime* out) {
  if (!out) return errorStatus(ErrorKind::kValidation, "null output");
  const std::string t = trim(text);
  const size_t colon = t.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2 || t.size() - colon - 1 != 2) {
    return errorStatus(ErrorKind::kValidation, "duration must be HH:MM: " + text);
  }
  for (size_t i = 0; i < t.size(); ++i) {
    if (i != colon && !std::isdigit(static_cast<unsigned char>(t[i]))) {
      return errorStatus(ErrorKind::kValidation, "duration must be HH:MM: " + text);
    }
  }
  const int hours = std::stoi(t.substr(0, colon));
  const int minutes = std::stoi(t.substr(colon + 1));
  if (minutes >= 60) {
    return errorStatus(ErrorKind::kValidation, "duration minutes must be below 60: " + text);
  }
  out->hours = hours;
  out->minutes = minutes;
  return okStatus();
}

size_t applyRegisters(uint16_t start,
                      const std::vector<uint16_t>& values,
                      Snapshot* snapshot,
                      std::vector<std::string>* errors) {
  if (!snapshot) return 0;
  size_t applied = 0;
  const std::vector<RegisterEntry>& map = registerMap();
  for (size_t i = 0; i < map.size(); ++i) {
    const RegisterEntry& entry = map[i];
    if (entry.address < start) continue;
    const size_t offset = static_cast<size_t>(entry.address - start);
    if (offset >= values.size()) continue;
    const uint16_t raw = values[offset];
    if (entry.decode(raw, snapshot)) {
      ++applied;
      continue;
    }
    if (errors) {
      std::ostringstream oss;
      oss << entry.name << ": malformed raw value " << raw << " at register " << entry.address;
      errors->push_back(oss.str());
    }
  }
  return applied;
}

}  // namespace register_codec
}  // namespace sauna_controller
