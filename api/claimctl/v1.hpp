#pragma once

#include "claimctl/core/v1/claim.pb.h"

namespace claimctl::v1 {
using namespace ::claimctl::core::v1;
}
