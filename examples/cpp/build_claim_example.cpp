#include <iostream>
#include <string>

#include "internal/claim/claim_builder.hpp"
#include "internal/claim/claim_codec.hpp"
#include "internal/claim/option_validator.hpp"
#include "internal/util/errors.hpp"

int main(int argc, char** argv) {
  // Request and limit can be passed on the command line to try other quantities.
  claimctl::claim::ClaimRequest request;
  request.name               = "data";
  request.namespace_name     = "team-a";
  request.storage_request    = argc > 1 ? argv[1] : "500Mi";
  request.storage_limit      = argc > 2 ? argv[2] : "1Gi";
  request.access_modes       = "ReadWriteOnce";
  request.storage_class_name = "standard";

  try {
    claimctl::claim::Validate(request);
    const auto spec = claimctl::claim::BuildClaim(request, true);

    // Quantities compare numerically, whatever unit they were written in.
    const auto& storage = spec.requests.at("storage");
    std::cout << "request " << storage.String() << " is "
              << (storage < claimctl::quantity::Capacity::Parse("1G") ? "below" : "at or above") << " 1G\n";

    std::cout << claimctl::claim::ToJson(claimctl::claim::ToProto(spec), true) << '\n';
  } catch (const claimctl::util::ValidationError& e) {
    std::cerr << "invalid request: " << e.what() << '\n';
    return 1;
  } catch (const claimctl::util::BuildError& e) {
    std::cerr << "cannot build claim: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
