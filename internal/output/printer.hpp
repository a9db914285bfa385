#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "claimctl/v1.hpp"

namespace claimctl::output {

enum class OutputFormat : std::uint8_t {
  kDefault = 0, // "kind/name <operation>"
  kName    = 1, // "kind/name"
  kJson    = 2,
  kYaml    = 3,
};

// "" maps to kDefault. Anything unknown throws util::UsageError.
OutputFormat ParseOutputFormat(std::string_view text);

/*
  Renders a claim for the user.

  Implementations:
    NamePrinter → persistentvolumeclaim/<name> [operation]
    JsonPrinter → indented protobuf JSON
    YamlPrinter → block YAML with sorted keys
*/
class Printer {
 public:
  virtual ~Printer() = default;

  virtual void Print(const claimctl::v1::PersistentVolumeClaim& claim, std::ostream& out) const = 0;
};

/*
  operation is what happened to the object ("created", "created (dry run)").
  Only the default format shows it.
*/
std::unique_ptr<Printer> MakePrinter(OutputFormat format, std::string operation);

} // namespace claimctl::output
