#pragma once

#include <string>

namespace claimctl::claim {

/*
  Raw user input for one claim, exactly as given on the command line.

  Empty strings mean "not supplied". Nothing here is parsed or checked;
  see Validate() and BuildClaim().
*/
struct ClaimRequest {
  std::string name;
  std::string namespace_name;
  std::string storage_request;
  std::string storage_limit;
  // Comma-separated, e.g. "ReadWriteOnce,ReadOnlyMany".
  std::string access_modes;
  std::string storage_class_name;
};

} // namespace claimctl::claim
