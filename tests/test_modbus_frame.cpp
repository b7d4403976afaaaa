#include <catch2/catch.hpp>

#include "modbus_tcp/modbus_frame.hpp"

#include <vector>

using namespace modbus_tcp;

// Helper: 0x03 response with MBAP header for the given transaction.
static std::vector<uint8_t> make_read_response(uint16_t tid, const std::vector<uint16_t>& values) {
  const uint16_t length = static_cast<uint16_t>(3 + values.size() * 2);
  std::vector<uint8_t> frame = {
      static_cast<uint8_t>(tid >> 8), static_cast<uint8_t>(tid & 0xFF), 0x00, 0x00,
      static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF), 0x01, 0x03,
      static_cast<uint8_t>(values.size() * 2)};
  for (auto v : values) {
    frame.push_back(static_cast<uint8_t>(v >> 8));
    frame.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  return frame;
}

TEST_CASE("Request framing", "[modbus][frame]") {
  bool ok = false;

  SECTION("read holding registers") {
    const auto pkt = createModbusPacket(kReadHoldingRegisters, 0x0102, 1, 1, 20, &ok);
    REQUIRE(ok);
    const std::vector<uint8_t> expected = {0x01, 0x02, 0x00, 0x00, 0x00, 0x06,
                                           0x01, 0x03, 0x00, 0x01, 0x00, 0x14};
    REQUIRE(pkt == expected);
  }

  SECTION("write single register carries the value") {
    const auto pkt = createModbusPacket(kWriteSingleRegister, 7, 1, 20, 1, &ok);
    REQUIRE(ok);
    REQUIRE(pkt.size() == 12);
    REQUIRE(pkt[7] == 0x06);
    REQUIRE(readBe16(&pkt[8]) == 20);
    REQUIRE(readBe16(&pkt[10]) == 1);
  }

  SECTION("unsupported function code and oversized reads are refused") {
    REQUIRE(createModbusPacket(0x10, 1, 1, 0, 1, &ok).empty());
    REQUIRE_FALSE(ok);
    REQUIRE(createModbusPacket(kReadHoldingRegisters, 1, 1, 0, 126, &ok).empty());
    REQUIRE_FALSE(ok);
    REQUIRE(createModbusPacket(kReadHoldingRegisters, 1, 1, 0, 0, &ok).empty());
  }
}

TEST_CASE("Read response parsing", "[modbus][frame]") {
  std::vector<uint16_t> values;

  SECTION("values are big-endian") {
    const auto resp = make_read_response(5, {95, 29, 0xFFFF});
    REQUIRE(parseReadResponse(resp, 5, 3, &values).ok);
    const std::vector<uint16_t> expected = {95, 29, 0xFFFF};
    REQUIRE(values == expected);
  }

  SECTION("transaction id must match") {
    const auto resp = make_read_response(5, {1});
    const auto s = parseReadResponse(resp, 6, 1, &values);
    REQUIRE_FALSE(s.ok);
    REQUIRE(s.message.find("transaction") != std::string::npos);
  }

  SECTION("byte count must cover the requested quantity") {
    const auto resp = make_read_response(5, {1, 2});
    REQUIRE_FALSE(parseReadResponse(resp, 5, 3, &values).ok);
  }

  SECTION("truncated frame is rejected") {
    auto resp = make_read_response(5, {1, 2});
    resp.pop_back();
    REQUIRE_FALSE(parseReadResponse(resp, 5, 2, &values).ok);
  }

  SECTION("exception response names the code") {
    const std::vector<uint8_t> resp = {0x00, 0x05, 0x00, 0x00, 0x00, 0x03, 0x01, 0x83, 0x02};
    REQUIRE(isExceptionResponse(resp));
    const auto s = parseReadResponse(resp, 5, 1, &values);
    REQUIRE_FALSE(s.ok);
    REQUIRE(s.message.find("illegal data address") != std::string::npos);
  }
}

TEST_CASE("Write response parsing", "[modbus][frame]") {
  bool ok = false;
  const auto request = createModbusPacket(kWriteSingleRegister, 9, 1, 1, 85, &ok);
  REQUIRE(ok);

  SECTION("echo acknowledges the write") {
    REQUIRE(parseWriteResponse(request, request).ok);
  }

  SECTION("a different echo is not an acknowledgement") {
    auto resp = request;
    resp[11] = 0x00;
    REQUIRE_FALSE(parseWriteResponse(resp, request).ok);
  }

  SECTION("unknown exception codes are shown in hex") {
    REQUIRE(describeException(0x2A) == "exception 0x2A");
  }
}
