#include "internal/claim/option_validator.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using claimctl::claim::ClaimRequest;

ClaimRequest MakeRequest() {
  ClaimRequest request;
  request.name            = "test-pvc";
  request.storage_request = "5Gi";
  return request;
}

// Empty when the request is accepted.
std::string Rejection(const ClaimRequest& request) {
  try {
    claimctl::claim::Validate(request);
  } catch (const claimctl::util::ValidationError& e) {
    return e.what();
  }
  return {};
}

void TestMissingNameIsReportedFirst() {
  ClaimRequest request;
  request.access_modes = "ReadWriteBoth";
  assert(Rejection(request) == "name must be specified");

  auto complete = MakeRequest();
  complete.name = "";
  assert(Rejection(complete) == "name must be specified");
}

void TestMissingStorageRequest() {
  auto request            = MakeRequest();
  request.storage_request = "";
  assert(Rejection(request) == "storage-request must be specified");

  request.access_modes = "ReadWriteBoth";
  assert(Rejection(request) == "storage-request must be specified");
}

void TestUnknownAccessModeIsNamed() {
  auto request         = MakeRequest();
  request.access_modes = "ReadWriteBoth";
  assert(Rejection(request) == "provided access mode ReadWriteBoth is invalid");

  request.access_modes = "ReadWriteOnce,ReadWriteBoth";
  assert(Rejection(request) == "provided access mode ReadWriteBoth is invalid");

  request.access_modes = "Bogus,ReadWriteBoth";
  assert(Rejection(request) == "provided access mode Bogus is invalid");

  request.access_modes = "readwriteonce";
  assert(Rejection(request) == "provided access mode readwriteonce is invalid");

  // Trailing separator leaves an empty token.
  request.access_modes = "ReadWriteOnce,";
  assert(Rejection(request) == "provided access mode  is invalid");
}

void TestKnownAccessModesAreAccepted() {
  auto request = MakeRequest();
  for (const auto* modes : {"ReadWriteOnce", "ReadOnlyMany", "ReadWriteMany", "ReadWriteOnce,ReadOnlyMany",
                            "ReadOnlyMany,ReadWriteMany,ReadWriteOnce", "ReadWriteOnce,ReadWriteOnce"}) {
    request.access_modes = modes;
    assert(Rejection(request).empty());
  }
}

void TestCapacitiesAreNotParsed() {
  auto request            = MakeRequest();
  request.storage_request = "lots";
  request.storage_limit   = "1Gi";
  assert(Rejection(request).empty());
}

} // namespace

int main() {
  TestMissingNameIsReportedFirst();
  TestMissingStorageRequest();
  TestUnknownAccessModeIsNamed();
  TestKnownAccessModesAreAccepted();
  TestCapacitiesAreNotParsed();

  std::cout << "claimctl_unit_option_validator: pass\n";
  return 0;
}
