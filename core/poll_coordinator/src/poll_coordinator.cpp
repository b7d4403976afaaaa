#include "sauna_controller/poll_coordinator/poll_coordinator.hpp"

#include "sauna_controller/common/device_serial.hpp"
#include "sauna_controller/register_codec/register_codec.hpp"

#include <algorithm>
#include <utility>

namespace sauna_controller {
namespace poll_coordinator {

namespace {

class InFlightReset {
 public:
  explicit InFlightReset(std::atomic<bool>& flag) : flag_(flag) {}
  ~InFlightReset() { flag_ = false; }

 private:
  std::atomic<bool>& flag_;
};

}  // namespace

int clampScanInterval(int seconds) {
  return std::min(std::max(seconds, kMinScanIntervalSec), kMaxScanIntervalSec);
}

const std::vector<std::string>& defaultDiscoveryCandidates() {
  static const std::vector<std::string> kCandidates = {
      "ffes.local", "sauna.local", "192.168.1.100", "192.168.0.100"};
  return kCandidates;
}

const char* pollOutcomeName(PollOutcome outcome) {
  switch (outcome) {
    case PollOutcome::kHealthy: return "healthy";
    case PollOutcome::kDegraded: return "degraded";
    case PollOutcome::kSkipped: return "skipped";
  }
  return "unknown";
}

PollCoordinator::PollCoordinator(CoordinatorOptions options,
                                 modbus_tcp::RegisterTransport& transport,
                                 address_resolver::AddressResolver& resolver)
    : options_(std::move(options)),
      transport_(transport),
      resolver_(resolver),
      running_(false),
      poll_in_flight_(false),
      consecutive_failures_(0),
      resolution_count_(0) {
  options_.scan_interval_sec = clampScanInterval(options_.scan_interval_sec);
  if (options_.resolve_failure_threshold < 1) options_.resolve_failure_threshold = 1;
  snapshot_.controller_model = options_.controller_model;
}

PollCoordinator::~PollCoordinator() {
  stop();
}

Status PollCoordinator::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) return okStatus("poll coordinator already running");
  running_ = true;
  poll_thread_ = std::thread([this]() { runLoop(); });
  return okStatus("polling " + options_.host + " every " +
                  std::to_string(options_.scan_interval_sec) + "s");
}

Status PollCoordinator::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  running_ = false;
  if (poll_thread_.joinable()) poll_thread_.join();
  return okStatus("poll coordinator stopped");
}

bool PollCoordinator::isRunning() const {
  return running_;
}

void PollCoordinator::runLoop() {
  const std::chrono::steady_clock::duration period = std::chrono::seconds(options_.scan_interval_sec);
  std::chrono::steady_clock::time_point next_due = std::chrono::steady_clock::now();
  while (running_) {
    const auto tick = std::chrono::steady_clock::now();
    if (tick < next_due) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      continue;
    }
    pollOnce();
    next_due += period;
    // Cycles that came due while the last one was still running are dropped.
    const auto after = std::chrono::steady_clock::now();
    int skipped = 0;
    while (next_due <= after) {
      next_due += period;
      ++skipped;
    }
    if (skipped > 0) {
      emitLog("⚠️ skipped " + std::to_string(skipped) + " overdue cycle(s)");
    }
  }
}

PollOutcome PollCoordinator::pollOnce() {
  bool expected = false;
  if (!poll_in_flight_.compare_exchange_strong(expected, true)) {
    emitLog("ℹ️ poll skipped: previous cycle still in flight");
    return PollOutcome::kSkipped;
  }
  InFlightReset reset(poll_in_flight_);

  Status s = okStatus();
  {
    std::lock_guard<std::mutex> lock(address_mutex_);
    const bool forced = consecutive_failures_ >= options_.resolve_failure_threshold;
    if (current_ip_.empty() || forced) s = resolveLocked(forced);
  }
  flushDeferredLogs();
  if (!s.ok) {
    markFailure(s);
    return PollOutcome::kDegraded;
  }

  const uint16_t start = register_codec::bulkReadStart();
  const uint16_t count = register_codec::bulkReadCount();
  std::vector<uint16_t> values;
  std::vector<std::string> decode_errors;
  Snapshot working = snapshot();
  {
    common::DeviceSerialGuard guard(deviceKey(), options_.io_gap_ms);
    s = transport_.readRegisters(start, count, &values);
    if (s.ok) readAuxiliaryOutputs(&working, &decode_errors);
  }
  if (!s.ok) {
    markFailure(s);
    return PollOutcome::kDegraded;
  }

  register_codec::applyRegisters(start, values, &working, &decode_errors);
  for (size_t i = 0; i < decode_errors.size(); ++i) {
    emitLog("⚠️ decode " + decode_errors[i]);
  }

  const bool recovered = !working.available && working.has_data;
  working.controller_model = options_.controller_model;
  working.available = true;
  working.has_data = true;
  working.last_error.clear();
  working.last_updated = std::chrono::system_clock::now();
  consecutive_failures_ = 0;
  if (recovered) emitLog("✅ device reachable again");
  publish(working);
  return PollOutcome::kHealthy;
}

void PollCoordinator::readAuxiliaryOutputs(Snapshot* working, std::vector<std::string>* errors) {
  struct Output {
    const char* name;
    int address;
    bool* field;
  };
  const Output outputs[] = {
      {"light", options_.light_register, &working->light},
      {"aux", options_.aux_register, &working->aux},
  };
  for (const Output& out : outputs) {
    if (out.address < 0) continue;
    std::vector<uint16_t> value;
    const Status s = transport_.readRegisters(static_cast<uint16_t>(out.address), 1, &value);
    if (!s.ok) {
      errors->push_back(std::string(out.name) + ": " + s.message);
      continue;
    }
    *out.field = value[0] != 0;
  }
}

Status PollCoordinator::ensureAddress() {
  Status s;
  {
    std::lock_guard<std::mutex> lock(address_mutex_);
    if (!current_ip_.empty()) return okStatus(current_ip_);
    s = resolveLocked(false);
  }
  flushDeferredLogs();
  return s;
}

Status PollCoordinator::resolveLocked(bool forced) {
  if (forced) {
    deferLogLocked("ℹ️ re-resolving " + options_.host + " after " +
                   std::to_string(consecutive_failures_.load()) + " consecutive failures");
  }

  address_resolver::ResolveResult result;
  const Status s = resolver_.resolve(options_.host, &result);
  ++resolution_count_;
  if (!s.ok) {
    // The last good address stays in use until a new answer replaces it.
    if (forced && !current_ip_.empty()) {
      deferLogLocked("⚠️ " + s.message + "; keeping " + current_ip_);
      return okStatus(current_ip_);
    }
    return s;
  }

  if (result.ip != current_ip_) {
    deferLogLocked("ℹ️ device address " +
                   (current_ip_.empty() ? std::string("(none)") : current_ip_) + " -> " +
                   result.ip + (result.from_cache ? " (cached)" : ""));
  }
  current_ip_ = result.ip;
  transport_.setEndpoint(result.ip, options_.port);
  return okStatus(result.ip);
}

Status PollCoordinator::discover(const std::vector<std::string>& candidates, DiscoveryResult* out) {
  if (!out) return errorStatus(ErrorKind::kValidation, "null output");
  if (candidates.empty()) return errorStatus(ErrorKind::kValidation, "no candidate hosts");
  bool expected = false;
  if (!poll_in_flight_.compare_exchange_strong(expected, true)) {
    return errorStatus(ErrorKind::kBusy, "discovery skipped: poll cycle in flight");
  }
  InFlightReset reset(poll_in_flight_);

  *out = DiscoveryResult{};
  Status found = errorStatus(ErrorKind::kResolution, "no sauna controller answered");
  {
    std::lock_guard<std::mutex> lock(address_mutex_);
    // Commands share the transport; they wait until the endpoint is restored.
    common::DeviceSerialGuard guard(deviceKey(), options_.io_gap_ms);
    for (const std::string& host : candidates) {
      address_resolver::ResolveResult resolved;
      Status s = resolver_.resolve(host, &resolved);
      if (s.ok) s = verifyController(resolved.ip, out);
      if (!s.ok) {
        out->rejected.push_back(host + ": " + s.message);
        continue;
      }
      out->host = host;
      out->ip = resolved.ip;
      found = okStatus(host + " -> " + resolved.ip);
      break;
    }
    if (!current_ip_.empty()) transport_.setEndpoint(current_ip_, options_.port);
  }
  emitLog(found.ok ? "✅ discovered " + found.message : "⚠️ " + found.message);
  return found;
}

Status PollCoordinator::verifyController(const std::string& ip, DiscoveryResult* out) {
  const auto* temp = register_codec::findEntry(register_codec::Field::kActualTemp);
  const auto* status = register_codec::findEntry(register_codec::Field::kControllerStatus);
  const uint16_t start = temp->address;
  const uint16_t count = static_cast<uint16_t>(status->address - start + 1);

  transport_.setEndpoint(ip, options_.port);
  std::vector<uint16_t> values;
  const Status s = transport_.readRegisters(start, count, &values);
  if (!s.ok) return s;
  if (values.size() != count) return errorStatus(ErrorKind::kTransport, "short read");

  const int actual_temp = register_codec::decodeTemperature(values.front());
  const ControllerStatus controller_status = register_codec::decodeStatus(values.back());
  if (actual_temp < temp->min_value || actual_temp > temp->max_value) {
    return errorStatus(ErrorKind::kValidation,
                       "actual temperature " + std::to_string(actual_temp) + " out of range");
  }
  if (controller_status == ControllerStatus::kUnknown) {
    return errorStatus(ErrorKind::kValidation,
                       "controller status " + std::to_string(values.back()) + " out of range");
  }
  out->actual_temp = actual_temp;
  out->controller_status = controller_status;
  return okStatus();
}

void PollCoordinator::markFailure(const Status& status) {
  const int failures = ++consecutive_failures_;
  Snapshot working = snapshot();
  if (working.available) emitLog("❌ device unavailable: " + status.message);
  working.available = false;
  working.last_error = std::string(errorKindName(status.kind)) + ": " + status.message;
  emitLog("⚠️ poll failed (" + std::to_string(failures) + " in a row): " + status.message);
  publish(working);
}

void PollCoordinator::publish(const Snapshot& snapshot) {
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = snapshot;
  }
  on_snapshot(snapshot);
}

Snapshot PollCoordinator::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::string PollCoordinator::deviceKey() const {
  return options_.host + ":" + std::to_string(options_.port);
}

std::string PollCoordinator::currentAddress() const {
  std::lock_guard<std::mutex> lock(address_mutex_);
  return current_ip_;
}

int PollCoordinator::consecutiveFailures() const {
  return consecutive_failures_;
}

size_t PollCoordinator::resolutionCount() const {
  return resolution_count_;
}

const CoordinatorOptions& PollCoordinator::options() const {
  return options_;
}

void PollCoordinator::emitLog(const std::string& text) {
  on_log(text);
}

void PollCoordinator::deferLogLocked(const std::string& text) {
  deferred_logs_.push_back(text);
}

void PollCoordinator::flushDeferredLogs() {
  std::vector<std::string> lines;
  {
    std::lock_guard<std::mutex> lock(address_mutex_);
    lines.swap(deferred_logs_);
  }
  for (size_t i = 0; i < lines.size(); ++i) emitLog(lines[i]);
}

}  // namespace poll_coordinator
}  // namespace sauna_controller
