#include "modbus_tcp/modbus_tcp_client.hpp"
#include "modbus_tcp/modbus_frame.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace modbus_tcp {

using sauna_controller::ErrorKind;
using sauna_controller::errorStatus;
using sauna_controller::okStatus;

ModbusTcpClient::ModbusTcpClient(uint8_t unit_id, double timeout_sec)
    : unit_id_(unit_id),
      timeout_sec_(timeout_sec),
      port_(502),
      transaction_id_(0),
      socket_fd_(-1) {}

ModbusTcpClient::~ModbusTcpClient() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  disconnectLocked();
}

Status ModbusTcpClient::connect(const std::string& ip, uint16_t port) {
  setEndpoint(ip, port);
  Status s;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    s = ensureConnectionLocked();
  }
  flushLogs();
  return s;
}

void ModbusTcpClient::setEndpoint(const std::string& ip, uint16_t port) {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (ip == ip_ && port == port_) return;
  disconnectLocked();
  ip_ = ip;
  port_ = port;
}

bool ModbusTcpClient::hasEndpoint() const {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  return !ip_.empty();
}

void ModbusTcpClient::close() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  disconnectLocked();
}

bool ModbusTcpClient::isConnected() const {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  return socket_fd_ >= 0;
}

Status ModbusTcpClient::readRegisters(uint16_t start,
                                      uint16_t count,
                                      std::vector<uint16_t>* values) {
  if (!values) return errorStatus(ErrorKind::kTransport, "null output");
  if (count < 1 || count > kMaxReadQuantity) {
    return errorStatus(ErrorKind::kTransport, "read quantity must be 1~125");
  }
  std::ostringstream ctx;
  ctx << "read addr=" << start << " qty=" << count;
  return execute(kReadHoldingRegisters, start, count, values, ctx.str());
}

Status ModbusTcpClient::writeRegister(uint16_t address, uint16_t value) {
  std::ostringstream ctx;
  ctx << "write addr=" << address << " value=" << value;
  return execute(kWriteSingleRegister, address, value, nullptr, ctx.str());
}

Status ModbusTcpClient::execute(uint8_t function_code,
                                uint16_t address,
                                uint16_t data,
                                std::vector<uint16_t>* values,
                                const std::string& context) {
  Status s;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    s = executeLocked(function_code, address, data, values, context);
  }
  flushLogs();
  return s;
}

Status ModbusTcpClient::executeLocked(uint8_t function_code,
                                      uint16_t address,
                                      uint16_t data,
                                      std::vector<uint16_t>* values,
                                      const std::string& context) {
  Status last;
  for (int attempt = 1; attempt <= 2; ++attempt) {
    const uint16_t tid = nextTransactionIdLocked();
    bool ok = false;
    const std::vector<uint8_t> packet =
        createModbusPacket(function_code, tid, unit_id_, address, data, &ok);
    if (!ok) return errorStatus(ErrorKind::kTransport, "unsupported request: " + context);

    std::vector<uint8_t> response;
    last = ensureConnectionLocked();
    if (last.ok) last = sendAndReceiveLocked(packet, &response, context);
    if (last.ok) {
      last = (function_code == kReadHoldingRegisters)
                 ? parseReadResponse(response, tid, data, values)
                 : parseWriteResponse(response, packet);
      if (last.ok) return last;
      // A well-formed exception reply leaves the stream in sync.
      if (!isExceptionResponse(response)) disconnectLocked();
    }
    queueLogLocked("⚠️ " + context + " attempt " + std::to_string(attempt) + " failed: " + last.message);
  }
  return errorStatus(ErrorKind::kTransport, context + ": " + last.message);
}

Status ModbusTcpClient::ensureConnectionLocked() {
  if (socket_fd_ >= 0) return okStatus();
  if (ip_.empty()) return errorStatus(ErrorKind::kConnection, "no device address");

  socket_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (socket_fd_ < 0) {
    return errorStatus(ErrorKind::kConnection,
                       std::string("socket failed: ") + std::strerror(errno));
  }

  timeval tv{};
  tv.tv_sec = static_cast<int>(timeout_sec_);
  tv.tv_usec = static_cast<int>((timeout_sec_ - tv.tv_sec) * 1000000.0);
  ::setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (::inet_pton(AF_INET, ip_.c_str(), &addr.sin_addr) != 1) {
    disconnectLocked();
    return errorStatus(ErrorKind::kConnection, "invalid device ip: " + ip_);
  }
  if (::connect(socket_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    const std::string reason = std::strerror(errno);
    disconnectLocked();
    return errorStatus(ErrorKind::kConnection,
                       "connect " + ip_ + ":" + std::to_string(port_) + " failed: " + reason);
  }
  queueLogLocked("ℹ️ connected to " + ip_ + ":" + std::to_string(port_));
  return okStatus();
}

void ModbusTcpClient::disconnectLocked() {
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

Status ModbusTcpClient::sendAndReceiveLocked(const std::vector<uint8_t>& packet,
                                             std::vector<uint8_t>* response,
                                             const std::string& context) {
  size_t sent = 0;
  while (sent < packet.size()) {
    const ssize_t n = ::send(socket_fd_, packet.data() + sent, packet.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string reason = std::strerror(errno);
      disconnectLocked();
      return errorStatus(ErrorKind::kConnection, "send failed: " + reason);
    }
    sent += static_cast<size_t>(n);
  }

  uint8_t header[kMbapHeaderSize];
  Status s = recvExactLocked(header, sizeof(header), context);
  if (!s.ok) return s;
  MbapHeader mbap;
  if (!parseMbapHeader(header, sizeof(header), &mbap) || mbap.length > 254) {
    disconnectLocked();
    return errorStatus(ErrorKind::kTransport, "malformed response header: " + context);
  }

  // The MBAP length counts the unit id already read.
  std::vector<uint8_t> body(mbap.length - 1);
  s = recvExactLocked(body.data(), body.size(), context);
  if (!s.ok) return s;

  response->assign(header, header + sizeof(header));
  response->insert(response->end(), body.begin(), body.end());
  return okStatus();
}

Status ModbusTcpClient::recvExactLocked(uint8_t* buf, size_t len, const std::string& context) {
  size_t got = 0;
  while (got < len) {
    const ssize_t n = ::recv(socket_fd_, buf + got, len - got, 0);
    if (n > 0) {
      got += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    const bool timed_out = (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK));
    const std::string reason =
        (n == 0) ? "connection closed by device" : (timed_out ? "timeout" : std::strerror(errno));
    disconnectLocked();
    return errorStatus(ErrorKind::kConnection, "no response (" + reason + "): " + context);
  }
  return okStatus();
}

uint16_t ModbusTcpClient::nextTransactionIdLocked() {
  transaction_id_ = static_cast<uint16_t>((transaction_id_ + 1) & 0xFFFF);
  return transaction_id_;
}

void ModbusTcpClient::queueLogLocked(const std::string& text) {
  pending_logs_.push_back(text);
}

void ModbusTcpClient::flushLogs() {
  std::vector<std::string> lines;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    lines.swap(pending_logs_);
  }
  for (size_t i = 0; i < lines.size(); ++i) on_log(lines[i]);
}

}  // namespace modbus_tcp
