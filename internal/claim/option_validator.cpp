#include "option_validator.hpp"

#include "internal/model/access_mode.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace claimctl::claim {

void Validate(const ClaimRequest& request) {
  if (request.name.empty()) {
    throw util::ValidationError("name must be specified");
  }
  if (request.storage_request.empty()) {
    throw util::ValidationError("storage-request must be specified");
  }

  if (!request.access_modes.empty()) {
    for (const auto& token : util::Split(request.access_modes, ',')) {
      if (!model::ParseAccessMode(token)) {
        throw util::ValidationError("provided access mode " + token + " is invalid");
      }
    }
  }
}

} // namespace claimctl::claim
