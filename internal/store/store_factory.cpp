#include "store_factory.hpp"

#include <cstdlib>
#include <filesystem>
#include <utility>

#include "disk/disk_claim_store.hpp"

namespace claimctl::store {

namespace {

std::filesystem::path DefaultRoot() {
  if (const char* home = std::getenv("HOME")) {
    if (*home != '\0') {
      return std::filesystem::path(home) / ".claimctl" / "store";
    }
  }
  return std::filesystem::path{"/tmp/claimctl"};
}

} // namespace

ClaimStorePtr StoreFactory::Build(const claimctl::runtime::config::StoreConfig& cfg) {
  std::filesystem::path root = cfg.root_path().empty() ? DefaultRoot() : std::filesystem::path{cfg.root_path()};
  return std::make_shared<DiskClaimStore>(std::move(root));
}

} // namespace claimctl::store
