#pragma once

#include "sauna_controller/common/status.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/signals2.hpp>

namespace sauna_controller {
namespace address_resolver {

struct ResolvedAddress {
  std::string hostname;
  std::string ip;
  std::chrono::system_clock::time_point resolved_at;
};

// Last good multicast-local resolution per hostname. Only successful lookups
// are stored.
class ResolvedAddressCache {
 public:
  void store(const std::string& hostname,
             const std::string& ip,
             std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
  bool lookup(const std::string& hostname, ResolvedAddress* out) const;
  void invalidate(const std::string& hostname);
  void clear();
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ResolvedAddress> entries_;
};

// Name-service backend. Returns every address found (any family) as text.
class HostLookup {
 public:
  virtual ~HostLookup() = default;
  virtual Status lookup(const std::string& hostname,
                        std::chrono::milliseconds timeout,
                        std::vector<std::string>* addresses) = 0;
};

// getaddrinfo() on a worker thread with a bounded wait. Multicast-local names
// go through the system resolver (nss-mdns or systemd-resolved).
// At most one worker runs per hostname: a caller that arrives while an earlier
// lookup is still pending waits on that lookup instead of starting another.
// The destructor waits for every pending worker.
class SystemHostLookup : public HostLookup {
 public:
  struct Answer {
    int rc = 0;  // getaddrinfo() return code
    std::vector<std::string> addresses;
  };
  using BlockingLookupFn = std::function<Answer(const std::string& hostname)>;

  // An empty function selects getaddrinfo().
  explicit SystemHostLookup(BlockingLookupFn blocking_lookup = BlockingLookupFn());
  ~SystemHostLookup() override;

  SystemHostLookup(const SystemHostLookup&) = delete;
  SystemHostLookup& operator=(const SystemHostLookup&) = delete;

  Status lookup(const std::string& hostname,
                std::chrono::milliseconds timeout,
                std::vector<std::string>* addresses) override;
  size_t pendingLookups() const;

 private:
  BlockingLookupFn blocking_lookup_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_future<Answer>> in_flight_;
};

struct ResolverOptions {
  std::string multicast_suffix = ".local";
  std::chrono::milliseconds multicast_timeout{5000};
  std::chrono::milliseconds dns_timeout{5000};
};

struct ResolveResult {
  std::string ip;
  bool from_cache = false;
  bool literal = false;
};

class AddressResolver {
 public:
  explicit AddressResolver(std::unique_ptr<HostLookup> lookup,
                           ResolverOptions options = ResolverOptions());

  boost::signals2::signal<void(const std::string&)> on_log;

  // Literal IPv4 -> unchanged; plain hostname -> name service; multicast-local
  // name -> live lookup, cached, falling back to the cached IP when the live
  // lookup fails. Only IPv4 results are accepted.
  Status resolve(const std::string& host, ResolveResult* out);
  void invalidate(const std::string& host);

  const ResolvedAddressCache& cache() const;
  ResolvedAddressCache& cache();

  static bool isIpv4Literal(const std::string& text);
  bool isMulticastLocal(const std::string& host) const;

 private:
  Status resolveNameLocked(const std::string& host,
                           ResolveResult* out,
                           std::vector<std::string>* logs);
  Status lookupIpv4(const std::string& host, std::chrono::milliseconds timeout, std::string* ip);

  std::unique_ptr<HostLookup> lookup_;
  ResolverOptions options_;
  ResolvedAddressCache cache_;
  std::mutex resolve_mutex_;
};

}  // namespace address_resolver
}  // namespace sauna_controller
