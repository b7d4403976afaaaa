#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sauna_controller {
namespace common {

// Serialize all requests targeting the same device. Different devices get
// independent locks, so one slow controller never stalls another.
class DeviceSerialGuard {
 public:
  DeviceSerialGuard(const std::string& device_key, std::uint32_t min_gap_ms = 120)
      : min_gap_(std::chrono::milliseconds(min_gap_ms)),
        entry_(entryFor(device_key)),
        lock_(entry_->mutex) {
    if (entry_->has_last_send) {
      const auto due = entry_->last_send + min_gap_;
      const auto now = std::chrono::steady_clock::now();
      if (due > now) std::this_thread::sleep_for(due - now);
    }
  }

  ~DeviceSerialGuard() {
    entry_->last_send = std::chrono::steady_clock::now();
    entry_->has_last_send = true;
  }

  DeviceSerialGuard(const DeviceSerialGuard&) = delete;
  DeviceSerialGuard& operator=(const DeviceSerialGuard&) = delete;

 private:
  struct Entry {
    std::mutex mutex;
    std::chrono::steady_clock::time_point last_send;
    bool has_last_send = false;
  };

  static std::shared_ptr<Entry> entryFor(const std::string& key) {
    static std::mutex registry_mutex;
    static std::unordered_map<std::string, std::shared_ptr<Entry>> registry;
    std::lock_guard<std::mutex> lock(registry_mutex);
    std::shared_ptr<Entry>& slot = registry[key];
    if (!slot) slot = std::make_shared<Entry>();
    return slot;
  }

  std::chrono::steady_clock::duration min_gap_;
  std::shared_ptr<Entry> entry_;
  std::unique_lock<std::mutex> lock_;
};

}  // namespace common
}  // namespace sauna_controller
