#include "printer.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/claim/claim_codec.hpp"
#include "internal/util/errors.hpp"

namespace claimctl::output {

using claimctl::v1::PersistentVolumeClaim;

namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

class NamePrinter final : public Printer {
 public:
  NamePrinter(std::string operation, bool short_output) : operation_(std::move(operation)), short_output_(short_output) {
  }

  void Print(const PersistentVolumeClaim& claim, std::ostream& out) const override {
    out << Lower(claim.kind()) << '/' << claim.metadata().name();
    if (!short_output_ && !operation_.empty()) {
      out << ' ' << operation_;
    }
    out << '\n';
  }

 private:
  std::string operation_;
  bool        short_output_;
};

class JsonPrinter final : public Printer {
 public:
  void Print(const PersistentVolumeClaim& claim, std::ostream& out) const override {
    out << claim::ToJson(claim, true);
    out << '\n';
  }
};

// Plain scalars that YAML would read back as something other than a string.
bool ReadsAsNonString(const std::string& text) {
  if (text.empty() || text == "~" || Lower(text) == "null") {
    return true;
  }
  YAML::Node probe(text);
  bool       as_bool   = false;
  double     as_number = 0;
  return YAML::convert<bool>::decode(probe, as_bool) || YAML::convert<double>::decode(probe, as_number);
}

void EmitValue(YAML::Emitter& out, const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
      out << YAML::Null;
      break;

    case google::protobuf::Value::kNumberValue:
      out << value.number_value();
      break;

    case google::protobuf::Value::kStringValue:
      if (ReadsAsNonString(value.string_value())) {
        out << YAML::DoubleQuoted;
      }
      out << value.string_value();
      break;

    case google::protobuf::Value::kBoolValue:
      out << value.bool_value();
      break;

    case google::protobuf::Value::kStructValue: {
      const auto&              fields = value.struct_value().fields();
      std::vector<std::string> keys;
      keys.reserve(fields.size());
      for (const auto& [key, unused] : fields) {
        keys.push_back(key);
      }
      std::sort(keys.begin(), keys.end());

      out << YAML::BeginMap;
      for (const auto& key : keys) {
        out << YAML::Key << key << YAML::Value;
        EmitValue(out, fields.at(key));
      }
      out << YAML::EndMap;
      break;
    }

    case google::protobuf::Value::kListValue:
      out << YAML::BeginSeq;
      for (const auto& item : value.list_value().values()) {
        EmitValue(out, item);
      }
      out << YAML::EndSeq;
      break;

    default:
      throw std::runtime_error("Unsupported JSON value");
  }
}

class YamlPrinter final : public Printer {
 public:
  void Print(const PersistentVolumeClaim& claim, std::ostream& out) const override {
    google::protobuf::Value document;
    auto status = google::protobuf::util::JsonStringToMessage(claim::ToJson(claim, false), &document);
    if (!status.ok()) {
      throw std::runtime_error("Failed to convert claim for YAML output: " + std::string(status.message()));
    }

    YAML::Emitter emitter;
    EmitValue(emitter, document);
    if (!emitter.good()) {
      throw std::runtime_error("Failed to emit YAML: " + emitter.GetLastError());
    }
    out << emitter.c_str() << '\n';
  }
};

} // namespace

OutputFormat ParseOutputFormat(std::string_view text) {
  const auto format = Lower(text);
  if (format.empty()) {
    return OutputFormat::kDefault;
  }
  if (format == "name") {
    return OutputFormat::kName;
  }
  if (format == "json") {
    return OutputFormat::kJson;
  }
  if (format == "yaml") {
    return OutputFormat::kYaml;
  }
  throw util::UsageError("unable to match a printer suitable for the output format \"" + std::string(text) +
                         "\", allowed formats are: json,name,yaml");
}

std::unique_ptr<Printer> MakePrinter(OutputFormat format, std::string operation) {
  switch (format) {
    case OutputFormat::kJson:
      return std::make_unique<JsonPrinter>();
    case OutputFormat::kYaml:
      return std::make_unique<YamlPrinter>();
    case OutputFormat::kName:
      return std::make_unique<NamePrinter>(std::move(operation), true);
    case OutputFormat::kDefault:
    default:
      return std::make_unique<NamePrinter>(std::move(operation), false);
  }
}

} // namespace claimctl::output
