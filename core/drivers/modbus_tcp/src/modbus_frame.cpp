#include "modbus_tcp/modbus_frame.hpp"

#include <iomanip>
#include <sstream>

namespace modbus_tcp {

using sauna_controller::ErrorKind;
using sauna_controller::errorStatus;
using sauna_controller::okStatus;

uint16_t readBe16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

std::vector<uint8_t> createModbusPacket(uint8_t function_code,
                                        uint16_t transaction_id,
                                        uint8_t unit_id,
                                        uint16_t address,
                                        uint16_t data,
                                        bool* ok) {
  if (ok) *ok = false;
  if (!(function_code == kReadHoldingRegisters || function_code == kWriteSingleRegister)) {
    return {};
  }
  if (function_code == kReadHoldingRegisters && (data < 1 || data > kMaxReadQuantity)) {
    return {};
  }

  const uint16_t protocol_id = 0x0000;
  const uint16_t length = 6;
  std::vector<uint8_t> pkt;
  pkt.reserve(12);
  pkt.push_back(static_cast<uint8_t>((transaction_id >> 8) & 0xFF));
  pkt.push_back(static_cast<uint8_t>(transaction_id & 0xFF));
  pkt.push_back(static_cast<uint8_t>((protocol_id >> 8) & 0xFF));
  pkt.push_back(static_cast<uint8_t>(protocol_id & 0xFF));
  pkt.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
  pkt.push_back(static_cast<uint8_t>(length & 0xFF));
  pkt.push_back(unit_id);
  pkt.push_back(function_code);
  pkt.push_back(static_cast<uint8_t>((address >> 8) & 0xFF));
  pkt.push_back(static_cast<uint8_t>(address & 0xFF));
  pkt.push_back(static_cast<uint8_t>((data >> 8) & 0xFF));
  pkt.push_back(static_cast<uint8_t>(data & 0xFF));
  if (ok) *ok = true;
  return pkt;
}

bool parseMbapHeader(const uint8_t* p, size_t len, MbapHeader* out) {
  if (!p || !out || len < kMbapHeaderSize) return false;
  out->transaction_id = readBe16(p);
  out->protocol_id = readBe16(p + 2);
  out->length = readBe16(p + 4);
  out->unit_id = p[6];
  return out->protocol_id == 0 && out->length >= 2;
}

bool isExceptionResponse(const std::vector<uint8_t>& response) {
  return response.size() >= 9 && (response[7] & kExceptionFlag) != 0;
}

std::string describeException(uint8_t code) {
  switch (code) {
    case 0x01: return "illegal function";
    case 0x02: return "illegal data address";
    case 0x03: return "illegal data value";
    case 0x04: return "server device failure";
    case 0x06: return "server device busy";
    case 0x0B: return "gateway target failed to respond";
    default: break;
  }
  std::ostringstream oss;
  oss << "exception 0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
      << static_cast<int>(code);
  return oss.str();
}

Status parseReadResponse(const std::vector<uint8_t>& response,
                         uint16_t transaction_id,
                         uint16_t quantity,
                         std::vector<uint16_t>* values) {
  if (!values) return errorStatus(ErrorKind::kTransport, "null output");
  values->clear();
  MbapHeader header;
  if (!parseMbapHeader(response.data(), response.size(), &header) || response.size() < 9) {
    return errorStatus(ErrorKind::kTransport, "response too short");
  }
  if (header.transaction_id != transaction_id) {
    return errorStatus(ErrorKind::kTransport, "transaction id mismatch");
  }
  if (isExceptionResponse(response)) {
    return errorStatus(ErrorKind::kTransport, "device returned " + describeException(response[8]));
  }
  if (response[7] != kReadHoldingRegisters) {
    return errorStatus(ErrorKind::kTransport, "unexpected function code");
  }
  const uint8_t data_len = response[8];
  const size_t expected_len = 9 + data_len;
  if (response.size() != expected_len) {
    std::ostringstream oss;
    oss << "response length " << response.size() << ", expected " << expected_len;
    return errorStatus(ErrorKind::kTransport, oss.str());
  }
  if (data_len != quantity * 2) {
    std::ostringstream oss;
    oss << "byte count " << static_cast<int>(data_len) << " does not cover " << quantity
        << " registers";
    return errorStatus(ErrorKind::kTransport, oss.str());
  }
  for (uint16_t i = 0; i < quantity; ++i) {
    const size_t base = 9 + i * 2;
    values->push_back(readBe16(&response[base]));
  }
  return okStatus();
}

Status parseWriteResponse(const std::vector<uint8_t>& response,
                          const std::vector<uint8_t>& request) {
  if (isExceptionResponse(response)) {
    return errorStatus(ErrorKind::kTransport, "device returned " + describeException(response[8]));
  }
  if (response != request) {
    return errorStatus(ErrorKind::kTransport,
                       "write not acknowledged, response length=" + std::to_string(response.size()));
  }
  return okStatus();
}

}  // namespace modbus_tcp
