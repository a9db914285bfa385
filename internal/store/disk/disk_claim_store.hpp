#pragma once

#include <filesystem>

#include "internal/store/claim_store.hpp"

namespace claimctl::store {

/*
  Durable claim storage on the local filesystem.

  Layout:
    <root>/<namespace>/<name>.json

  Properties:
    - exclusive publish: an existing claim is never replaced
    - directories created on first write, not at construction
*/

class DiskClaimStore final : public ClaimStore {
public:
  explicit DiskClaimStore(std::filesystem::path root);

  claimctl::v1::PersistentVolumeClaim Create(const std::string& namespace_name,
                                             const claimctl::v1::PersistentVolumeClaim& claim,
                                             const CreateOptions& options) override;

  std::optional<claimctl::v1::PersistentVolumeClaim> Get(const std::string& namespace_name,
                                                         const std::string& name) override;

private:
  std::filesystem::path root_;
};

}
