#include "claim_builder.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace claimctl::claim {

namespace {

void ParseResources(const ClaimRequest& request, ClaimSpec& spec) {
  const auto storage_request = quantity::Capacity::Parse(request.storage_request);
  spec.requests.emplace(kResourceStorage, storage_request);

  if (request.storage_limit.empty()) {
    return;
  }

  const auto storage_limit = quantity::Capacity::Parse(request.storage_limit);
  if (storage_limit <= storage_request) {
    throw util::BuildError("resource limit is the same/less than the resource request");
  }
  spec.limits.emplace(kResourceStorage, storage_limit);
}

} // namespace

ClaimSpec BuildClaim(const ClaimRequest& request, bool enforce_namespace) {
  ClaimSpec spec;
  spec.api_version = std::string(kApiVersion);
  spec.kind        = std::string(kKind);
  spec.name        = request.name;
  if (enforce_namespace) {
    spec.namespace_name = request.namespace_name;
  }

  ParseResources(request, spec);

  if (!request.access_modes.empty()) {
    spec.access_modes = util::Split(request.access_modes, ',');
  }
  if (!request.storage_class_name.empty()) {
    spec.storage_class_name = request.storage_class_name;
  }
  return spec;
}

} // namespace claimctl::claim
