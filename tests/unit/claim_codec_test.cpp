#include "internal/claim/claim_codec.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/claim/claim_builder.hpp"

namespace {

using claimctl::claim::BuildClaim;
using claimctl::claim::ClaimRequest;

ClaimRequest MakeRequest(const std::string& storage_request) {
  ClaimRequest request;
  request.name            = "test-pvc";
  request.storage_request = storage_request;
  return request;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestAbsentFieldsAreNotSerialized() {
  const auto claim = claimctl::claim::ToProto(BuildClaim(MakeRequest("5Gi"), false));
  const auto json  = claimctl::claim::ToJson(claim, false);

  assert(Contains(json, "\"apiVersion\":\"v1\""));
  assert(Contains(json, "\"kind\":\"PersistentVolumeClaim\""));
  assert(Contains(json, "\"name\":\"test-pvc\""));
  assert(Contains(json, "\"requests\":{\"storage\":\"5Gi\"}"));

  assert(!Contains(json, "limits"));
  assert(!Contains(json, "accessModes"));
  assert(!Contains(json, "storageClassName"));
  assert(!Contains(json, "namespace"));
  assert(!Contains(json, "annotations"));
}

void TestPopulatedFields() {
  auto request               = MakeRequest("500Mi");
  request.namespace_name     = "team-a";
  request.storage_limit      = "1024Mi";
  request.access_modes       = "ReadWriteOnce,ReadOnlyMany";
  request.storage_class_name = "test-class";

  const auto claim = claimctl::claim::ToProto(BuildClaim(request, true));

  assert(claim.metadata().namespace_() == "team-a");
  assert(claim.spec().resources().requests().at("storage") == "500Mi");
  // Quantities are written canonically.
  assert(claim.spec().resources().limits().at("storage") == "1Gi");
  assert(claim.spec().access_modes_size() == 2);
  assert(claim.spec().access_modes(0) == "ReadWriteOnce");
  assert(claim.spec().access_modes(1) == "ReadOnlyMany");
  assert(claim.spec().has_storage_class_name());
  assert(claim.spec().storage_class_name() == "test-class");

  const auto json = claimctl::claim::ToJson(claim, false);
  assert(Contains(json, "\"storageClassName\":\"test-class\""));
  assert(Contains(json, "\"namespace\":\"team-a\""));
}

void TestFromJsonRejectsUnknownFields() {
  const auto claim = claimctl::claim::FromJson(R"({"apiVersion":"v1","metadata":{"name":"x"}})");
  assert(claim.metadata().name() == "x");

  bool threw = false;
  try {
    (void)claimctl::claim::FromJson(R"({"apiVersion":"v1","status":{}})");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "FromJson must reject unknown fields.");
}

void TestLastAppliedConfiguration() {
  auto       claim    = claimctl::claim::ToProto(BuildClaim(MakeRequest("5Gi"), false));
  const auto original = claimctl::claim::ToJson(claim, false);
  const std::string key(claimctl::claim::kLastAppliedConfigAnnotation);

  claimctl::claim::SetLastAppliedConfiguration(claim);
  assert(claim.metadata().annotations().size() == 1);
  assert(claim.metadata().annotations().at(key) == original);

  // Re-annotating does not nest the previous annotation.
  claimctl::claim::SetLastAppliedConfiguration(claim);
  assert(claim.metadata().annotations().at(key) == original);
}

} // namespace

int main() {
  TestAbsentFieldsAreNotSerialized();
  TestPopulatedFields();
  TestFromJsonRejectsUnknownFields();
  TestLastAppliedConfiguration();

  std::cout << "claimctl_unit_claim_codec: pass\n";
  return 0;
}
