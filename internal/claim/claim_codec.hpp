#pragma once

#include <string>
#include <string_view>

#include "claimctl/v1.hpp"
#include "internal/claim/claim_spec.hpp"

namespace claimctl::claim {

inline constexpr std::string_view kLastAppliedConfigAnnotation = "kubectl.kubernetes.io/last-applied-configuration";

/*
  Wire form of a claim.

  Quantities are written in canonical form. Absent fields stay unset so they
  are left out of JSON and YAML output.
*/
claimctl::v1::PersistentVolumeClaim ToProto(const ClaimSpec& spec);

std::string                         ToJson(const claimctl::v1::PersistentVolumeClaim& claim, bool pretty);
claimctl::v1::PersistentVolumeClaim FromJson(const std::string& json);

/*
  Records the claim's own compact JSON, taken without this annotation, under
  kLastAppliedConfigAnnotation. Replaces any earlier value.
*/
void SetLastAppliedConfiguration(claimctl::v1::PersistentVolumeClaim& claim);

} // namespace claimctl::claim
