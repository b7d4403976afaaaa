#pragma once

#include "sauna_controller/common/snapshot.hpp"
#include "sauna_controller/common/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sauna_controller {
namespace register_codec {

enum class Field {
  kSetTemp,
  kActualTemp,
  kProfile,
  kSessionTime,
  kVentilationTime,
  kAromaValue,
  kHumidityValue,
  kErrorCode,
  kHumidity,
  kControllerStatus,
};

constexpr int kMinTemperature = 20;
constexpr int kMaxTemperature = 110;
constexpr int kMinPercent = 0;
constexpr int kMaxPercent = 100;
constexpr int kMaxPackedHours = 99;

// Decoders return false and leave the snapshot untouched on a malformed value.
using DecodeFn = bool (*)(uint16_t raw, Snapshot* out);
// Encoders validate the domain value; nullptr marks a read-only register.
using EncodeFn = Status (*)(int value, uint16_t* raw);

struct RegisterEntry {
  Field field;
  const char* name;
  uint16_t address;
  int min_value;
  int max_value;
  DecodeFn decode;
  EncodeFn encode;
};

const std::vector<RegisterEntry>& registerMap();
const RegisterEntry* findEntry(Field field);
const RegisterEntry* findEntry(const std::string& name);

// Smallest [start, start + count) window covering every mapped address.
uint16_t bulkReadStart();
uint16_t bulkReadCount();

Status encodeTemperature(int celsius, uint16_t* raw);
Status encodePercent(int percent, uint16_t* raw);
Status encodePackedTime(int packed, uint16_t* raw);
Status encodeStatus(int status, uint16_t* raw);
Status encodeProfile(int profile, uint16_t* raw);
Status encodeField(Field field, int value, uint16_t* raw);

bool decodePackedTime(uint16_t raw, PackedTime* out);
ControllerStatus decodeStatus(uint16_t raw);
SaunaProfile decodeProfile(uint16_t raw);
int decodeTemperature(uint16_t raw);

// Accepts "HH:MM" (or "H:MM") with minutes below 60.
Status parseDuration(const std::string& text, PackedTime* out);
Status parseBool(const std::string& text, bool* out);
Status parseInteger(const std::string& text, int* out);

// Applies every mapped register found in the block starting at `start`.
// Malformed fields are reported in `errors` and keep their previous value.
size_t applyRegisters(uint16_t start,
                      const std::vector<uint16_t>& values,
                      Snapshot* snapshot,
                      std::vector<std::string>* errors);

}  // namespace register_codec
}  // namespace sauna_controller
