#include <catch2/catch.hpp>

#include "fakes/fake_host_lookup.hpp"
#include "sauna_controller/address_resolver/address_resolver.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace sauna_controller;
using namespace sauna_controller::address_resolver;
using sauna_controller::testing::FakeHostLookup;
using sauna_controller::testing::HostLookupScript;

TEST_CASE("Address resolution", "[resolver]") {
  auto script = std::make_shared<HostLookupScript>();
  AddressResolver resolver(std::make_unique<FakeHostLookup>(script));
  ResolveResult result;

  SECTION("a literal IPv4 address never reaches the name service") {
    REQUIRE(resolver.resolve("192.168.1.40", &result).ok);
    REQUIRE(result.ip == "192.168.1.40");
    REQUIRE(result.literal);
    REQUIRE(script->calls.empty());
  }

  SECTION("a multicast-local name is cached after a live answer") {
    script->answers["ffes.local"] = {"192.168.1.50"};
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    REQUIRE(result.ip == "192.168.1.50");
    REQUIRE_FALSE(result.from_cache);
    ResolvedAddress cached;
    REQUIRE(resolver.cache().lookup("ffes.local", &cached));
    REQUIRE(cached.ip == "192.168.1.50");
  }

  SECTION("a failed live lookup falls back to the cached address") {
    script->answers["ffes.local"] = {"192.168.1.50"};
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    script->answers.clear();

    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    REQUIRE(result.ip == "192.168.1.50");
    REQUIRE(result.from_cache);
    REQUIRE(script->calls["ffes.local"] == 2);
  }

  SECTION("a new live answer replaces the cached address") {
    script->answers["ffes.local"] = {"192.168.1.50"};
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    script->answers["ffes.local"] = {"192.168.1.51"};
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    REQUIRE(result.ip == "192.168.1.51");
    ResolvedAddress cached;
    REQUIRE(resolver.cache().lookup("ffes.local", &cached));
    REQUIRE(cached.ip == "192.168.1.51");
  }

  SECTION("no live answer and no cache is a resolution error") {
    const Status s = resolver.resolve("ffes.local", &result);
    REQUIRE_FALSE(s.ok);
    REQUIRE(s.kind == ErrorKind::kResolution);
  }

  SECTION("an invalidated entry is no longer offered") {
    script->answers["ffes.local"] = {"192.168.1.50"};
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    script->fail_all = true;
    resolver.invalidate("ffes.local");
    REQUIRE_FALSE(resolver.resolve("ffes.local", &result).ok);
  }

  SECTION("IPv6-only answers are rejected") {
    script->answers["ffes.local"] = {"fe80::1"};
    REQUIRE_FALSE(resolver.resolve("ffes.local", &result).ok);
    script->answers["ffes.local"] = {"fe80::1", "10.0.0.7"};
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    REQUIRE(result.ip == "10.0.0.7");
  }

  SECTION("log slots may resolve again") {
    script->answers["ffes.local"] = {"192.168.1.50"};
    script->answers["sauna.local"] = {"192.168.1.60"};
    bool nested = false;
    std::string nested_ip;
    resolver.on_log.connect([&resolver, &nested, &nested_ip](const std::string&) {
      if (nested) return;
      nested = true;
      ResolveResult inner;
      if (resolver.resolve("sauna.local", &inner).ok) nested_ip = inner.ip;
    });
    REQUIRE(resolver.resolve("ffes.local", &result).ok);
    REQUIRE(result.ip == "192.168.1.50");
    REQUIRE(nested_ip == "192.168.1.60");
  }

  SECTION("plain DNS names are resolved but not cached") {
    script->answers["sauna.example.net"] = {"10.1.2.3"};
    REQUIRE(resolver.resolve("sauna.example.net", &result).ok);
    REQUIRE(result.ip == "10.1.2.3");
    REQUIRE(resolver.cache().size() == 0);
  }
}

TEST_CASE("Multicast-local detection", "[resolver]") {
  AddressResolver resolver(nullptr);
  REQUIRE(resolver.isMulticastLocal("ffes.local"));
  REQUIRE(resolver.isMulticastLocal("FFES.LOCAL."));
  REQUIRE_FALSE(resolver.isMulticastLocal("local"));
  REQUIRE_FALSE(resolver.isMulticastLocal("ffes.example.com"));
  REQUIRE(AddressResolver::isIpv4Literal("10.0.0.1"));
  REQUIRE_FALSE(AddressResolver::isIpv4Literal("10.0.0"));
}

// ============================================================================
// System lookup worker handling
// ============================================================================

static SystemHostLookup::Answer answerWith(const std::string& ip) {
  SystemHostLookup::Answer answer;
  answer.addresses.push_back(ip);
  return answer;
}

TEST_CASE("System lookup runs one worker per hostname", "[resolver][lookup]") {
  using std::chrono::milliseconds;
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> workers{0};
  SystemHostLookup lookup([&workers, gate](const std::string&) {
    ++workers;
    gate.wait();
    return answerWith("192.168.1.50");
  });
  std::vector<std::string> addresses;

  // CHECK keeps going so the worker is always released before teardown.
  const Status first = lookup.lookup("ffes.local", milliseconds(50), &addresses);
  CHECK_FALSE(first.ok);
  CHECK(first.kind == ErrorKind::kResolution);
  CHECK(first.message.find("timed out") != std::string::npos);
  CHECK_FALSE(lookup.lookup("ffes.local", milliseconds(50), &addresses).ok);
  CHECK(workers.load() == 1);
  CHECK(lookup.pendingLookups() == 1);
  release.set_value();

  while (lookup.pendingLookups() != 0) std::this_thread::sleep_for(milliseconds(1));
  REQUIRE(lookup.lookup("ffes.local", milliseconds(1000), &addresses).ok);
  REQUIRE(addresses.size() == 1);
  REQUIRE(addresses[0] == "192.168.1.50");
  // A settled lookup is never reused; the next call asks again.
  REQUIRE(workers.load() == 2);
}

TEST_CASE("System lookup teardown waits for pending workers", "[resolver][lookup]") {
  using std::chrono::milliseconds;
  std::atomic<bool> finished{false};
  {
    SystemHostLookup lookup([&finished](const std::string&) {
      std::this_thread::sleep_for(milliseconds(100));
      finished = true;
      return answerWith("10.0.0.9");
    });
    std::vector<std::string> addresses;
    REQUIRE_FALSE(lookup.lookup("slow.local", milliseconds(5), &addresses).ok);
  }
  REQUIRE(finished.load());
}
