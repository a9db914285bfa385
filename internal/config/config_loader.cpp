#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace claimctl::config {

namespace {

using google::protobuf::Value;

// Plain scalars get YAML 1.2 core typing; quoted ones stay strings.
Value ScalarToValue(const YAML::Node& node) {
  Value       value;
  const auto& text = node.Scalar();

  if (node.Tag() == "!") {
    value.set_string_value(text);
    return value;
  }
  if (text == "~" || text == "null") {
    value.set_null_value(google::protobuf::NULL_VALUE);
    return value;
  }
  if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
    return value;
  }

  char* end = nullptr;
  if (const double number = std::strtod(text.c_str(), &end); !text.empty() && *end == '\0') {
    value.set_number_value(number);
    return value;
  }

  value.set_string_value(text);
  return value;
}

Value ToValue(const YAML::Node& node) {
  Value value;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      return value;

    case YAML::NodeType::Scalar:
      return ScalarToValue(node);

    case YAML::NodeType::Sequence: {
      auto* list = value.mutable_list_value();
      for (const auto& item : node) {
        *list->add_values() = ToValue(item);
      }
      return value;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("config keys must be scalars");
        }
        fields[entry.first.Scalar()] = ToValue(entry.second);
      }
      return value;
    }

    default:
      throw std::runtime_error("unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// YAML → JSON → RuntimeConfig
// ------------------------------------------------------------

claimctl::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("failed to load config " + path + ": " + e.what());
  }

  claimctl::runtime::config::RuntimeConfig config;
  if (document.IsNull()) {
    return config;
  }
  if (!document.IsMap()) {
    throw std::runtime_error("invalid config " + path + ": top level must be a mapping");
  }

  std::string json;
  try {
    auto status = google::protobuf::util::MessageToJsonString(ToValue(document), &json);
    if (!status.ok()) {
      throw std::runtime_error(std::string(status.message()));
    }
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("invalid config " + path + ": " + e.what());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("invalid config " + path + ": " + std::string(status.message()));
  }
  return config;
}

std::optional<std::string> ConfigLoader::ResolvePath(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    return explicit_path;
  }

  if (const char* env = std::getenv("CLAIMCTL_CONFIG"); env && *env != '\0') {
    return std::string(env);
  }

  if (const char* home = std::getenv("HOME"); home && *home != '\0') {
    const auto candidate = std::filesystem::path(home) / ".claimctl" / "config.yaml";
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate.string();
    }
  }

  return std::nullopt;
}

claimctl::runtime::config::RuntimeConfig ConfigLoader::Load(const std::string& explicit_path) {
  const auto path = ResolvePath(explicit_path);
  return path ? LoadFromYaml(*path) : claimctl::runtime::config::RuntimeConfig{};
}

} // namespace claimctl::config
