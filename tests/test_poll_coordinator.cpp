#include <catch2/catch.hpp>

#include "fakes/fake_host_lookup.hpp"
#include "fakes/fake_transport.hpp"
#include "sauna_controller/poll_coordinator/poll_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace sauna_controller;
using namespace sauna_controller::poll_coordinator;
using sauna_controller::testing::FakeHostLookup;
using sauna_controller::testing::FakeTransport;
using sauna_controller::testing::HostLookupScript;

namespace {

CoordinatorOptions testOptions() {
  CoordinatorOptions options;
  options.host = "ffes.local";
  options.io_gap_ms = 0;
  return options;
}

// Blocks inside the first read until released.
class GatedTransport : public FakeTransport {
 public:
  Status readRegisters(uint16_t start, uint16_t count, std::vector<uint16_t>* values) override {
    entered = true;
    gate.wait();
    return FakeTransport::readRegisters(start, count, values);
  }

  std::atomic<bool> entered{false};
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
};

}  // namespace

TEST_CASE("Poll cycle", "[poll]") {
  auto script = std::make_shared<HostLookupScript>();
  script->answers["ffes.local"] = {"192.168.1.50"};
  address_resolver::AddressResolver resolver(std::make_unique<FakeHostLookup>(script));
  FakeTransport transport;
  transport.set(1, 95);
  transport.set(2, 29);
  transport.set(4, 2);
  transport.set(5, 40);
  transport.set(20, 3);
  PollCoordinator coordinator(testOptions(), transport, resolver);

  int published = 0;
  coordinator.on_snapshot.connect([&published](const Snapshot&) { ++published; });

  SECTION("a healthy cycle resolves, reads and publishes") {
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    const Snapshot s = coordinator.snapshot();
    REQUIRE(s.available);
    REQUIRE(s.has_data);
    REQUIRE(s.set_temp == 95);
    REQUIRE(s.actual_temp == 29);
    REQUIRE(s.profile == SaunaProfile::kDry);
    REQUIRE(s.controller_status == ControllerStatus::kStandby);
    REQUIRE(s.controller_model == 2);
    REQUIRE(transport.endpoints.size() == 1);
    REQUIRE(transport.endpoints[0] == "192.168.1.50:502");
    REQUIRE(published == 1);
  }

  SECTION("log slots may read the coordinator state") {
    std::vector<std::string> seen;
    coordinator.on_log.connect([&coordinator, &seen](const std::string&) {
      seen.push_back(coordinator.currentAddress());
    });
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE_FALSE(seen.empty());
    REQUIRE(seen.back() == "192.168.1.50");
  }

  SECTION("the address is resolved once while cycles succeed") {
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.resolutionCount() == 1);
    REQUIRE(script->calls["ffes.local"] == 1);
  }

  SECTION("a failed cycle keeps values and drops availability") {
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    transport.failing_reads = 1;
    REQUIRE(coordinator.pollOnce() == PollOutcome::kDegraded);
    const Snapshot s = coordinator.snapshot();
    REQUIRE_FALSE(s.available);
    REQUIRE(s.set_temp == 95);
    REQUIRE(s.last_error.find("transport") == 0);
    REQUIRE(published == 2);
  }

  SECTION("one successful cycle restores availability") {
    transport.failing_reads = 1;
    REQUIRE(coordinator.pollOnce() == PollOutcome::kDegraded);
    REQUIRE_FALSE(coordinator.snapshot().has_data);
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.snapshot().available);
    REQUIRE(coordinator.consecutiveFailures() == 0);
  }

  SECTION("threshold failures force re-resolution on the next cycle") {
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    transport.failing_reads = 3;
    for (int i = 0; i < 3; ++i) {
      REQUIRE(coordinator.pollOnce() == PollOutcome::kDegraded);
    }
    REQUIRE(coordinator.resolutionCount() == 1);
    REQUIRE(coordinator.consecutiveFailures() == 3);

    script->answers["ffes.local"] = {"192.168.1.77"};
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.resolutionCount() == 2);
    REQUIRE(coordinator.currentAddress() == "192.168.1.77");
    REQUIRE(transport.endpoints.back() == "192.168.1.77:502");
  }

  SECTION("a long outage ends while the name service is still down") {
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    script->fail_all = true;
    transport.failing_reads = 5;
    for (int i = 0; i < 5; ++i) {
      REQUIRE(coordinator.pollOnce() == PollOutcome::kDegraded);
    }
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.snapshot().available);
    REQUIRE(coordinator.currentAddress() == "192.168.1.50");
    REQUIRE(coordinator.resolutionCount() == 4);
    REQUIRE(transport.read_calls == 7);
  }

  SECTION("a failed forced re-resolution keeps a plain DNS address") {
    CoordinatorOptions options = testOptions();
    options.host = "sauna.lan";
    script->answers["sauna.lan"] = {"192.168.1.60"};
    PollCoordinator dns_coordinator(options, transport, resolver);
    REQUIRE(dns_coordinator.pollOnce() == PollOutcome::kHealthy);
    script->fail_all = true;
    transport.failing_reads = 4;
    for (int i = 0; i < 4; ++i) {
      REQUIRE(dns_coordinator.pollOnce() == PollOutcome::kDegraded);
    }
    REQUIRE(dns_coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(dns_coordinator.currentAddress() == "192.168.1.60");
  }

  SECTION("no address at all degrades with a resolution error") {
    script->answers.clear();
    REQUIRE(coordinator.pollOnce() == PollOutcome::kDegraded);
    REQUIRE(coordinator.snapshot().last_error.find("resolution") == 0);
    REQUIRE(transport.read_calls == 0);
  }
}

TEST_CASE("Poll cycle with configured outputs", "[poll]") {
  auto script = std::make_shared<HostLookupScript>();
  FakeTransport transport;
  address_resolver::AddressResolver resolver(std::make_unique<FakeHostLookup>(script));
  CoordinatorOptions options = testOptions();
  options.host = "10.0.0.9";

  SECTION("light and aux are read when their registers are configured") {
    options.light_register = 30;
    options.aux_register = 31;
    transport.set(30, 1);
    PollCoordinator coordinator(options, transport, resolver);
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.snapshot().light);
    REQUIRE_FALSE(coordinator.snapshot().aux);
    REQUIRE(transport.read_calls == 3);
  }

  SECTION("unconfigured outputs report off without extra reads") {
    PollCoordinator coordinator(options, transport, resolver);
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE_FALSE(coordinator.snapshot().light);
    REQUIRE(transport.read_calls == 1);
    REQUIRE(script->calls.empty());
  }
}

TEST_CASE("Controller discovery", "[poll][discover]") {
  auto script = std::make_shared<HostLookupScript>();
  script->answers["sauna.local"] = {"192.168.1.60"};
  address_resolver::AddressResolver resolver(std::make_unique<FakeHostLookup>(script));
  FakeTransport transport;
  transport.set(2, 24);
  transport.set(20, 0);
  transport.unreachable.insert("192.168.1.100");
  PollCoordinator coordinator(testOptions(), transport, resolver);
  DiscoveryResult result;

  SECTION("the default candidates start with the factory hostname") {
    REQUIRE(defaultDiscoveryCandidates().size() == 4);
    REQUIRE(defaultDiscoveryCandidates().front() == "ffes.local");
  }

  SECTION("the first candidate that reads back as a controller wins") {
    const Status s = coordinator.discover({"ffes.local", "192.168.1.100", "sauna.local"}, &result);
    REQUIRE(s.ok);
    REQUIRE(result.host == "sauna.local");
    REQUIRE(result.ip == "192.168.1.60");
    REQUIRE(result.actual_temp == 24);
    REQUIRE(result.controller_status == ControllerStatus::kOff);
    REQUIRE(result.rejected.size() == 2);
    REQUIRE(result.rejected[0].find("ffes.local") == 0);
    REQUIRE(result.rejected[1].find("192.168.1.100") == 0);
    REQUIRE(transport.read_calls == 2);
  }

  SECTION("a device with an impossible status is not accepted") {
    transport.set(20, 7);
    const Status s = coordinator.discover({"sauna.local"}, &result);
    REQUIRE_FALSE(s.ok);
    REQUIRE(s.kind == ErrorKind::kResolution);
    REQUIRE(result.rejected.size() == 1);
    REQUIRE(result.rejected[0].find("controller status 7") != std::string::npos);
  }

  SECTION("the polled endpoint is restored afterwards") {
    script->answers["ffes.local"] = {"192.168.1.50"};
    REQUIRE(coordinator.pollOnce() == PollOutcome::kHealthy);
    REQUIRE(coordinator.discover({"sauna.local"}, &result).ok);
    REQUIRE(transport.endpoints.back() == "192.168.1.50:502");
    REQUIRE(coordinator.currentAddress() == "192.168.1.50");
  }

  SECTION("an empty candidate list is rejected") {
    REQUIRE(coordinator.discover({}, &result).kind == ErrorKind::kValidation);
  }
}

TEST_CASE("Overlapping poll cycles", "[poll][concurrency]") {
  auto script = std::make_shared<HostLookupScript>();
  address_resolver::AddressResolver resolver(std::make_unique<FakeHostLookup>(script));
  GatedTransport transport;
  CoordinatorOptions options = testOptions();
  options.host = "10.0.0.9";
  PollCoordinator coordinator(options, transport, resolver);

  std::future<PollOutcome> first =
      std::async(std::launch::async, [&coordinator]() { return coordinator.pollOnce(); });
  while (!transport.entered) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  REQUIRE(coordinator.pollOnce() == PollOutcome::kSkipped);
  transport.release.set_value();
  REQUIRE(first.get() == PollOutcome::kHealthy);
  REQUIRE(transport.read_calls == 1);
}

TEST_CASE("Poll loop lifecycle", "[poll]") {
  auto script = std::make_shared<HostLookupScript>();
  address_resolver::AddressResolver resolver(std::make_unique<FakeHostLookup>(script));
  FakeTransport transport;
  CoordinatorOptions options = testOptions();
  options.host = "10.0.0.9";
  options.scan_interval_sec = 1;
  PollCoordinator coordinator(options, transport, resolver);

  SECTION("scan interval is clamped") {
    REQUIRE(coordinator.options().scan_interval_sec == kMinScanIntervalSec);
    REQUIRE(clampScanInterval(1000) == kMaxScanIntervalSec);
    REQUIRE(clampScanInterval(15) == 15);
  }

  SECTION("the first cycle runs right after start") {
    REQUIRE(coordinator.start().ok);
    REQUIRE(coordinator.isRunning());
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!coordinator.snapshot().has_data && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(coordinator.snapshot().available);
    REQUIRE(coordinator.stop().ok);
    REQUIRE_FALSE(coordinator.isRunning());
  }
}
