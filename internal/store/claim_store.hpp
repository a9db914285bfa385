#pragma once

#include <memory>
#include <optional>
#include <string>

#include "claimctl/v1.hpp"

namespace claimctl::store {

struct CreateOptions {
  // Run every create check but persist nothing.
  bool dry_run = false;
};

/*
  Destination for created claims.

  Stands in for the cluster API's create call. The claim core never talks
  to a store; the CLI does, after a claim has been built.

  Implementations:
    DISK   → one JSON document per claim under a root directory
    MEMORY → process-local map
*/
class ClaimStore {
 public:
  virtual ~ClaimStore() = default;

  // ------------------------------------------------------------------
  // Create
  // ------------------------------------------------------------------
  /*
    Stores claim under namespace_name and returns the stored object, with
    metadata.namespace filled in.

    Throws util::AlreadyExists when namespace_name already holds a claim
    with the same name.
  */
  virtual claimctl::v1::PersistentVolumeClaim Create(const std::string&                         namespace_name,
                                                     const claimctl::v1::PersistentVolumeClaim& claim,
                                                     const CreateOptions&                       options) = 0;

  // ------------------------------------------------------------------
  // Get
  // ------------------------------------------------------------------
  virtual std::optional<claimctl::v1::PersistentVolumeClaim> Get(const std::string& namespace_name,
                                                                 const std::string& name) = 0;
};

using ClaimStorePtr = std::shared_ptr<ClaimStore>;

} // namespace claimctl::store
