#pragma once

#include "sauna_controller/address_resolver/address_resolver.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sauna_controller {
namespace testing {

// Shared so a test keeps control after handing the lookup to a resolver.
struct HostLookupScript {
  std::map<std::string, std::vector<std::string>> answers;
  std::map<std::string, int> calls;
  bool fail_all = false;
};

class FakeHostLookup : public address_resolver::HostLookup {
 public:
  explicit FakeHostLookup(std::shared_ptr<HostLookupScript> script) : script_(std::move(script)) {}

  Status lookup(const std::string& hostname,
                std::chrono::milliseconds,
                std::vector<std::string>* addresses) override {
    ++script_->calls[hostname];
    addresses->clear();
    const auto it = script_->answers.find(hostname);
    if (script_->fail_all || it == script_->answers.end()) {
      return errorStatus(ErrorKind::kResolution, "no answer for " + hostname);
    }
    *addresses = it->second;
    return okStatus();
  }

 private:
  std::shared_ptr<HostLookupScript> script_;
};

}  // namespace testing
}  // namespace sauna_controller
