#pragma once

#include "internal/claim/claim_request.hpp"

namespace claimctl::claim {

/*
  Shape checks on raw input, in order:
    1. name is set
    2. storage request is set
    3. every comma-separated access mode is a known mode

  Throws util::ValidationError for the first failing rule. Capacities are not
  parsed here; a malformed quantity surfaces from BuildClaim().
*/
void Validate(const ClaimRequest& request);

} // namespace claimctl::claim
