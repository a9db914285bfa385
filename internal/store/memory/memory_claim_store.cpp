#include "memory_claim_store.hpp"

#include "internal/store/common/errors.hpp"

namespace claimctl::store {

using claimctl::v1::PersistentVolumeClaim;

std::string MemoryClaimStore::Key(const std::string& namespace_name, const std::string& name) {
  return namespace_name + "/" + name;
}

PersistentVolumeClaim MemoryClaimStore::Create(const std::string& namespace_name,
                                               const PersistentVolumeClaim& claim,
                                               const CreateOptions& options) {
  const auto& name = claim.metadata().name();
  const auto key = Key(namespace_name, name);

  std::lock_guard<std::mutex> lock(mutex_);
  if (claims_.contains(key)) throw common::ClaimAlreadyExists(name);

  PersistentVolumeClaim stored = claim;
  stored.mutable_metadata()->set_namespace_(namespace_name);

  if (!options.dry_run) claims_.emplace(key, stored);
  return stored;
}

std::optional<PersistentVolumeClaim> MemoryClaimStore::Get(const std::string& namespace_name, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claims_.find(Key(namespace_name, name));
  if (it == claims_.end()) return std::nullopt;
  return it->second;
}

std::size_t MemoryClaimStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return claims_.size();
}

} // namespace claimctl::store
