#include "sauna_controller/address_resolver/address_resolver.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <utility>

namespace sauna_controller {
namespace address_resolver {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

SystemHostLookup::Answer blockingGetAddrInfo(const std::string& hostname) {
  SystemHostLookup::Answer outcome;
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  outcome.rc = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
  if (outcome.rc != 0) return outcome;
  for (addrinfo* it = result; it != nullptr; it = it->ai_next) {
    char buf[INET6_ADDRSTRLEN] = {0};
    const void* src = nullptr;
    if (it->ai_family == AF_INET) {
      src = &reinterpret_cast<sockaddr_in*>(it->ai_addr)->sin_addr;
    } else if (it->ai_family == AF_INET6) {
      src = &reinterpret_cast<sockaddr_in6*>(it->ai_addr)->sin6_addr;
    } else {
      continue;
    }
    if (::inet_ntop(it->ai_family, src, buf, sizeof(buf)) != nullptr) {
      outcome.addresses.push_back(buf);
    }
  }
  ::freeaddrinfo(result);
  return outcome;
}

}  // namespace

void ResolvedAddressCache::store(const std::string& hostname,
                                 const std::string& ip,
                                 std::chrono::system_clock::time_point now) {
  if (ip.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[hostname] = ResolvedAddress{hostname, ip, now};
}

bool ResolvedAddressCache::lookup(const std::string& hostname, ResolvedAddress* out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(hostname);
  if (it == entries_.end()) return false;
  if (out) *out = it->second;
  return true;
}

void ResolvedAddressCache::invalidate(const std::string& hostname) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(hostname);
}

void ResolvedAddressCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

size_t ResolvedAddressCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

SystemHostLookup::SystemHostLookup(BlockingLookupFn blocking_lookup)
    : blocking_lookup_(blocking_lookup ? std::move(blocking_lookup)
                                       : BlockingLookupFn(blockingGetAddrInfo)) {}

SystemHostLookup::~SystemHostLookup() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = in_flight_.begin(); it != in_flight_.end(); ++it) it->second.wait();
  in_flight_.clear();
}

Status SystemHostLookup::lookup(const std::string& hostname,
                                std::chrono::milliseconds timeout,
                                std::vector<std::string>* addresses) {
  if (!addresses) return errorStatus(ErrorKind::kResolution, "null output");
  addresses->clear();

  std::shared_future<Answer> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(hostname);
    if (it != in_flight_.end() &&
        it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      in_flight_.erase(it);
      it = in_flight_.end();
    }
    if (it == in_flight_.end()) {
      // getaddrinfo() cannot be cancelled; a timed-out worker stays registered
      // and later callers join it.
      std::shared_future<Answer> started =
          std::async(std::launch::async, blocking_lookup_, hostname).share();
      it = in_flight_.emplace(hostname, started).first;
    }
    pending = it->second;
  }

  if (pending.wait_for(timeout) != std::future_status::ready) {
    return errorStatus(ErrorKind::kResolution,
                       "lookup of " + hostname + " timed out after " +
                           std::to_string(timeout.count()) + "ms");
  }
  const Answer answer = pending.get();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(hostname);
    if (it != in_flight_.end() &&
        it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      in_flight_.erase(it);
    }
  }
  if (answer.rc != 0) {
    return errorStatus(ErrorKind::kResolution,
                       "lookup of " + hostname + " failed: " + ::gai_strerror(answer.rc));
  }
  *addresses = answer.addresses;
  return okStatus();
}

size_t SystemHostLookup::pendingLookups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t pending = 0;
  for (auto it = in_flight_.begin(); it != in_flight_.end(); ++it) {
    if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) ++pending;
  }
  return pending;
}

AddressResolver::AddressResolver(std::unique_ptr<HostLookup> lookup, ResolverOptions options)
    : lookup_(std::move(lookup)), options_(std::move(options)) {}

bool AddressResolver::isIpv4Literal(const std::string& text) {
  in_addr addr{};
  return ::inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

bool AddressResolver::isMulticastLocal(const std::string& host) const {
  std::string name = toLower(host);
  if (!name.empty() && name.back() == '.') name.pop_back();
  const std::string suffix = toLower(options_.multicast_suffix);
  return name.size() > suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const ResolvedAddressCache& AddressResolver::cache() const {
  return cache_;
}

ResolvedAddressCache& AddressResolver::cache() {
  return cache_;
}

void AddressResolver::invalidate(const std::string& host) {
  cache_.invalidate(host);
}

Status AddressResolver::resolve(const std::string& host, ResolveResult* out) {
  if (!out) return errorStatus(ErrorKind::kResolution, "null output");
  if (host.empty()) return errorStatus(ErrorKind::kResolution, "empty host");
  *out = ResolveResult{};

  if (isIpv4Literal(host)) {
    out->ip = host;
    out->literal = true;
    return okStatus();
  }

  std::vector<std::string> logs;
  Status s;
  {
    std::lock_guard<std::mutex> lock(resolve_mutex_);
    s = resolveNameLocked(host, out, &logs);
  }
  for (size_t i = 0; i < logs.size(); ++i) on_log(logs[i]);
  return s;
}

Status AddressResolver::resolveNameLocked(const std::string& host,
                                          ResolveResult* out,
                                          std::vector<std::string>* logs) {
  if (!isMulticastLocal(host)) {
    const Status s = lookupIpv4(host, options_.dns_timeout, &out->ip);
    if (s.ok) logs->push_back("ℹ️ resolved " + host + " -> " + out->ip);
    return s;
  }

  const Status live = lookupIpv4(host, options_.multicast_timeout, &out->ip);
  if (live.ok) {
    cache_.store(host, out->ip);
    logs->push_back("ℹ️ resolved " + host + " -> " + out->ip);
    return live;
  }

  ResolvedAddress cached;
  if (cache_.lookup(host, &cached)) {
    const auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - cached.resolved_at);
    logs->push_back("⚠️ " + live.message + "; using cached " + cached.ip + " (age " +
                    std::to_string(age.count()) + "s)");
    out->ip = cached.ip;
    out->from_cache = true;
    return okStatus();
  }
  logs->push_back("❌ " + live.message + "; no cached address");
  return live;
}

Status AddressResolver::lookupIpv4(const std::string& host,
                                   std::chrono::milliseconds timeout,
                                   std::string* ip) {
  if (!lookup_) return errorStatus(ErrorKind::kResolution, "no name service configured");
  std::vector<std::string> addresses;
  const Status s = lookup_->lookup(host, timeout, &addresses);
  if (!s.ok) return errorStatus(ErrorKind::kResolution, s.message);
  for (size_t i = 0; i < addresses.size(); ++i) {
    if (isIpv4Literal(addresses[i])) {
      *ip = addresses[i];
      return okStatus();
    }
  }
  return errorStatus(ErrorKind::kResolution, "no IPv4 address for " + host);
}

}  // namespace address_resolver
}  // namespace sauna_controller
