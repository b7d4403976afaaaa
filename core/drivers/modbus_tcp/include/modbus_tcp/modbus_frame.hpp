#pragma once

#include "sauna_controller/common/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace modbus_tcp {

using sauna_controller::Status;

constexpr uint8_t kReadHoldingRegisters = 0x03;
constexpr uint8_t kWriteSingleRegister = 0x06;
constexpr uint8_t kExceptionFlag = 0x80;
constexpr size_t kMbapHeaderSize = 7;
constexpr uint16_t kMaxReadQuantity = 125;

struct MbapHeader {
  uint16_t transaction_id = 0;
  uint16_t protocol_id = 0;
  uint16_t length = 0;
  uint8_t unit_id = 0;
};

uint16_t readBe16(const uint8_t* p);

// Builds a 12-byte request. `data` is the quantity for 0x03 and the value for
// 0x06.
std::vector<uint8_t> createModbusPacket(uint8_t function_code,
                                        uint16_t transaction_id,
                                        uint8_t unit_id,
                                        uint16_t address,
                                        uint16_t data,
                                        bool* ok);

bool parseMbapHeader(const uint8_t* p, size_t len, MbapHeader* out);
bool isExceptionResponse(const std::vector<uint8_t>& response);
std::string describeException(uint8_t code);

Status parseReadResponse(const std::vector<uint8_t>& response,
                         uint16_t transaction_id,
                         uint16_t quantity,
                         std::vector<uint16_t>* values);
Status parseWriteResponse(const std::vector<uint8_t>& response,
                          const std::vector<uint8_t>& request);

}  // namespace modbus_tcp
