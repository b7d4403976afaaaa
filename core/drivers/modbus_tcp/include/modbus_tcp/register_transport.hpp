#pragma once

#include "sauna_controller/common/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace modbus_tcp {

using sauna_controller::Status;

// Holding-register access to one device. Implementations reconnect lazily on
// the next operation after an I/O error; nothing runs in the background.
class RegisterTransport {
 public:
  virtual ~RegisterTransport() = default;

  // Stores the endpoint and opens the connection right away.
  virtual Status connect(const std::string& ip, uint16_t port) = 0;
  // Stores the endpoint for the next operation; drops a connection to a
  // different endpoint.
  virtual void setEndpoint(const std::string& ip, uint16_t port) = 0;
  virtual bool hasEndpoint() const = 0;
  virtual void close() = 0;
  virtual bool isConnected() const = 0;

  virtual Status readRegisters(uint16_t start, uint16_t count, std::vector<uint16_t>* values) = 0;
  virtual Status writeRegister(uint16_t address, uint16_t value) = 0;
};

}  // namespace modbus_tcp
