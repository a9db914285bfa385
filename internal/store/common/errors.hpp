#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace claimctl::store::common {

inline util::AlreadyExists ClaimAlreadyExists(const std::string& name) {
  return util::AlreadyExists("persistentvolumeclaims \"" + name + "\" already exists");
}

} // namespace claimctl::store::common
