#include "claim_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace claimctl::claim {

using claimctl::v1::PersistentVolumeClaim;

namespace {

void CopyResources(const ResourceList& from, google::protobuf::Map<std::string, std::string>* to) {
  for (const auto& [resource, capacity] : from) {
    (*to)[resource] = capacity.String();
  }
}

} // namespace

PersistentVolumeClaim ToProto(const ClaimSpec& spec) {
  PersistentVolumeClaim claim;
  claim.set_api_version(spec.api_version);
  claim.set_kind(spec.kind);

  auto* metadata = claim.mutable_metadata();
  metadata->set_name(spec.name);
  metadata->set_namespace_(spec.namespace_name);

  auto* claim_spec = claim.mutable_spec();
  for (const auto& mode : spec.access_modes) {
    claim_spec->add_access_modes(mode);
  }

  auto* resources = claim_spec->mutable_resources();
  CopyResources(spec.requests, resources->mutable_requests());
  CopyResources(spec.limits, resources->mutable_limits());

  if (spec.storage_class_name) {
    claim_spec->set_storage_class_name(*spec.storage_class_name);
  }
  return claim;
}

std::string ToJson(const PersistentVolumeClaim& claim, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(claim, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize claim to JSON: " + std::string(status.message()));
  }
  return json;
}

PersistentVolumeClaim FromJson(const std::string& json) {
  PersistentVolumeClaim claim;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &claim, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid claim document: " + std::string(status.message()));
  }
  return claim;
}

void SetLastAppliedConfiguration(PersistentVolumeClaim& claim) {
  const std::string key(kLastAppliedConfigAnnotation);

  PersistentVolumeClaim original = claim;
  original.mutable_metadata()->mutable_annotations()->erase(key);

  (*claim.mutable_metadata()->mutable_annotations())[key] = ToJson(original, false);
}

} // namespace claimctl::claim
