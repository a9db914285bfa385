#pragma once

#include "internal/claim/claim_request.hpp"
#include "internal/claim/claim_spec.hpp"

namespace claimctl::claim {

/*
  Assembles a claim from a request.

  The namespace is copied only when enforce_namespace is set. Capacities are
  parsed here; util::ParseError escapes unchanged and util::BuildError is
  thrown when a limit is not strictly greater than the request. Access modes
  are carried verbatim, so callers that skip Validate() get unknown tokens
  back rather than an error.
*/
ClaimSpec BuildClaim(const ClaimRequest& request, bool enforce_namespace);

} // namespace claimctl::claim
