#pragma once

#include "config/config.pb.h"
#include "internal/store/claim_store.hpp"

namespace claimctl::store {

/*
  Builds the claim store from configuration.

  store.root_path, else $HOME/.claimctl/store, else /tmp/claimctl.
*/
class StoreFactory {
public:
  static ClaimStorePtr Build(const claimctl::runtime::config::StoreConfig& cfg);
};

} // namespace claimctl::store
