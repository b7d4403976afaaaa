#pragma once

#include "modbus_tcp/register_transport.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <boost/signals2.hpp>

namespace modbus_tcp {

class ModbusTcpClient : public RegisterTransport {
 public:
  explicit ModbusTcpClient(uint8_t unit_id = 1, double timeout_sec = 10.0);
  ~ModbusTcpClient() override;

  ModbusTcpClient(const ModbusTcpClient&) = delete;
  ModbusTcpClient& operator=(const ModbusTcpClient&) = delete;

  boost::signals2::signal<void(const std::string&)> on_log;

  Status connect(const std::string& ip, uint16_t port) override;
  void setEndpoint(const std::string& ip, uint16_t port) override;
  bool hasEndpoint() const override;
  void close() override;
  bool isConnected() const override;

  // Each operation gets one retry; a connection-level failure is retried on a
  // fresh connection.
  Status readRegisters(uint16_t start, uint16_t count, std::vector<uint16_t>* values) override;
  Status writeRegister(uint16_t address, uint16_t value) override;

 private:
  Status execute(uint8_t function_code,
                 uint16_t address,
                 uint16_t data,
                 std::vector<uint16_t>* values,
                 const std::string& context);
  Status executeLocked(uint8_t function_code,
                       uint16_t address,
                       uint16_t data,
                       std::vector<uint16_t>* values,
                       const std::string& context);
  Status ensureConnectionLocked();
  void disconnectLocked();
  Status sendAndReceiveLocked(const std::vector<uint8_t>& packet,
                              std::vector<uint8_t>* response,
                              const std::string& context);
  Status recvExactLocked(uint8_t* buf, size_t len, const std::string& context);
  uint16_t nextTransactionIdLocked();
  // on_log slots run after socket_mutex_ is released.
  void queueLogLocked(const std::string& text);
  void flushLogs();

  const uint8_t unit_id_;
  const double timeout_sec_;
  std::string ip_;
  uint16_t port_;
  uint16_t transaction_id_;
  int socket_fd_;
  std::vector<std::string> pending_logs_;
  mutable std::mutex socket_mutex_;
};

}  // namespace modbus_tcp
