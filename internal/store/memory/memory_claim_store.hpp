#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/store/claim_store.hpp"

namespace claimctl::store {

class MemoryClaimStore final : public ClaimStore {
public:
  claimctl::v1::PersistentVolumeClaim Create(const std::string& namespace_name,
                                             const claimctl::v1::PersistentVolumeClaim& claim,
                                             const CreateOptions& options) override;

  std::optional<claimctl::v1::PersistentVolumeClaim> Get(const std::string& namespace_name,
                                                         const std::string& name) override;

  std::size_t Size() const;

private:
  static std::string Key(const std::string& namespace_name, const std::string& name);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, claimctl::v1::PersistentVolumeClaim> claims_;
};

}
