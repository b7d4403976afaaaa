#pragma once

#include "modbus_tcp/register_transport.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sauna_controller {
namespace testing {

// In-memory holding registers. Reads and writes can be scripted to fail.
class FakeTransport : public modbus_tcp::RegisterTransport {
 public:
  Status connect(const std::string& ip, uint16_t port) override {
    setEndpoint(ip, port);
    connected = true;
    return okStatus();
  }

  void setEndpoint(const std::string& ip, uint16_t port) override {
    std::lock_guard<std::mutex> lock(mutex);
    endpoints.push_back(ip + ":" + std::to_string(port));
    ip_ = ip;
  }

  bool hasEndpoint() const override { return !ip_.empty(); }
  void close() override { connected = false; }
  bool isConnected() const override { return connected; }

  Status readRegisters(uint16_t start, uint16_t count, std::vector<uint16_t>* values) override {
    std::lock_guard<std::mutex> lock(mutex);
    ++read_calls;
    if (ip_.empty()) return errorStatus(ErrorKind::kConnection, "no device address");
    if (unreachable.count(ip_) != 0) {
      return errorStatus(ErrorKind::kTransport, "connect " + ip_ + " refused");
    }
    if (failing_reads > 0) {
      --failing_reads;
      return errorStatus(ErrorKind::kTransport, "scripted read failure");
    }
    values->clear();
    for (uint16_t i = 0; i < count; ++i) {
      const auto it = registers.find(static_cast<uint16_t>(start + i));
      values->push_back(it == registers.end() ? 0 : it->second);
    }
    return okStatus();
  }

  Status writeRegister(uint16_t address, uint16_t value) override {
    std::lock_guard<std::mutex> lock(mutex);
    if (ip_.empty()) return errorStatus(ErrorKind::kConnection, "no device address");
    if (fail_write_index >= 0 && static_cast<int>(write_attempts) == fail_write_index) {
      ++write_attempts;
      return errorStatus(ErrorKind::kTransport, "scripted write failure");
    }
    ++write_attempts;
    writes.push_back(std::make_pair(address, value));
    registers[address] = value;
    return okStatus();
  }

  void set(uint16_t address, uint16_t value) {
    std::lock_guard<std::mutex> lock(mutex);
    registers[address] = value;
  }

  std::vector<uint16_t> writtenAddresses() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<uint16_t> out;
    for (size_t i = 0; i < writes.size(); ++i) out.push_back(writes[i].first);
    return out;
  }

  mutable std::mutex mutex;
  std::map<uint16_t, uint16_t> registers;
  std::vector<std::pair<uint16_t, uint16_t>> writes;
  std::vector<std::string> endpoints;
  // Endpoints whose reads fail as if nothing were listening.
  std::set<std::string> unreachable;
  int failing_reads = 0;
  // Zero-based index of the write attempt that fails; -1 disables.
  int fail_write_index = -1;
  size_t write_attempts = 0;
  size_t read_calls = 0;
  bool connected = false;

 private:
  std::string ip_;
};

}  // namespace testing
}  // namespace sauna_controller
