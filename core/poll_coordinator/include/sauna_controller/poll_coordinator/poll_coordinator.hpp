#pragma once

#include "modbus_tcp/register_transport.hpp"
#include "sauna_controller/address_resolver/address_resolver.hpp"
#include "sauna_controller/common/snapshot.hpp"
#include "sauna_controller/common/status.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/signals2.hpp>

namespace sauna_controller {
namespace poll_coordinator {

constexpr int kDefaultScanIntervalSec = 15;
constexpr int kMinScanIntervalSec = 5;
constexpr int kMaxScanIntervalSec = 300;
constexpr int kDefaultResolveFailureThreshold = 3;

int clampScanInterval(int seconds);

struct CoordinatorOptions {
  std::string host = "ffes.local";
  uint16_t port = 502;
  int scan_interval_sec = kDefaultScanIntervalSec;
  int resolve_failure_threshold = kDefaultResolveFailureThreshold;
  uint32_t io_gap_ms = 120;
  int light_register = -1;
  int aux_register = -1;
  int controller_model = 2;
};

enum class PollOutcome {
  kHealthy,
  kDegraded,
  kSkipped,
};

const char* pollOutcomeName(PollOutcome outcome);

// Hosts tried by discover() when none are given.
const std::vector<std::string>& defaultDiscoveryCandidates();

struct DiscoveryResult {
  std::string host;
  std::string ip;
  int actual_temp = 0;
  ControllerStatus controller_status = ControllerStatus::kOff;
  // "<host>: <reason>" for every candidate that did not answer as a controller.
  std::vector<std::string> rejected;
};

// Sole writer of the device Snapshot. Healthy <-> Degraded on each cycle's
// result; values survive failures and only the availability flag drops.
class PollCoordinator {
 public:
  PollCoordinator(CoordinatorOptions options,
                  modbus_tcp::RegisterTransport& transport,
                  address_resolver::AddressResolver& resolver);
  ~PollCoordinator();

  PollCoordinator(const PollCoordinator&) = delete;
  PollCoordinator& operator=(const PollCoordinator&) = delete;

  boost::signals2::signal<void(const std::string&)> on_log;
  boost::signals2::signal<void(const Snapshot&)> on_snapshot;

  Status start();
  // Waits for an in-flight cycle to finish or time out before returning.
  Status stop();
  bool isRunning() const;

  // One cycle. Returns kSkipped without touching the device when another
  // cycle is still in flight.
  PollOutcome pollOnce();

  // Resolves the device address if none has been resolved yet.
  Status ensureAddress();

  // Tries each candidate in order and accepts the first one whose actual
  // temperature and controller status registers read back sane values. The
  // polled endpoint is left unchanged. kBusy while a cycle is in flight.
  Status discover(const std::vector<std::string>& candidates, DiscoveryResult* out);

  Snapshot snapshot() const;
  std::string deviceKey() const;
  std::string currentAddress() const;
  int consecutiveFailures() const;
  size_t resolutionCount() const;
  const CoordinatorOptions& options() const;

 private:
  Status resolveLocked(bool forced);
  Status verifyController(const std::string& ip, DiscoveryResult* out);
  // Light/aux registers sit outside the bulk window; failures stay field-level.
  void readAuxiliaryOutputs(Snapshot* working, std::vector<std::string>* errors);
  void markFailure(const Status& status);
  void publish(const Snapshot& snapshot);
  void runLoop();
  void emitLog(const std::string& text);
  // Lines produced under address_mutex_ are emitted once it is released.
  void deferLogLocked(const std::string& text);
  void flushDeferredLogs();

  CoordinatorOptions options_;
  modbus_tcp::RegisterTransport& transport_;
  address_resolver::AddressResolver& resolver_;

  std::atomic<bool> running_;
  std::atomic<bool> poll_in_flight_;
  std::atomic<int> consecutive_failures_;
  std::atomic<size_t> resolution_count_;
  std::thread poll_thread_;
  std::mutex lifecycle_mutex_;

  mutable std::mutex address_mutex_;
  std::string current_ip_;
  std::vector<std::string> deferred_logs_;

  mutable std::mutex snapshot_mutex_;
  Snapshot snapshot_;
};

}  // namespace poll_coordinator
}  // namespace sauna_controller
