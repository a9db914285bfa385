#include "create_command.hpp"

#include <stdexcept>
#include <utility>

#include "internal/claim/claim_builder.hpp"
#include "internal/claim/claim_codec.hpp"
#include "internal/claim/option_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace claimctl::cli {

namespace {

constexpr std::string_view kDefaultNamespace = "default";

using observability::BoolField;
using observability::StringField;

enum class FlagKind {
  kString,
  kBool,
  kDryRun,
};

struct FlagSpec {
  std::string_view name;
  char             shorthand;
  FlagKind         kind;
};

constexpr FlagSpec kFlags[] = {
    {"storage-request", 0, FlagKind::kString},
    {"storage-limit", 0, FlagKind::kString},
    {"access-modes", 0, FlagKind::kString},
    {"storage-class-name", 0, FlagKind::kString},
    {"namespace", 'n', FlagKind::kString},
    {"output", 'o', FlagKind::kString},
    {"config", 0, FlagKind::kString},
    {"dry-run", 0, FlagKind::kDryRun},
    {"save-config", 0, FlagKind::kBool},
    {"help", 'h', FlagKind::kBool},
};

const FlagSpec* FindFlag(std::string_view name) {
  for (const auto& flag : kFlags) {
    if (flag.name == name) {
      return &flag;
    }
  }
  return nullptr;
}

const FlagSpec* FindShorthand(char shorthand) {
  for (const auto& flag : kFlags) {
    if (flag.shorthand != 0 && flag.shorthand == shorthand) {
      return &flag;
    }
  }
  return nullptr;
}

bool ParseBool(std::string_view flag, std::string_view value) {
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  throw util::UsageError("invalid argument \"" + std::string(value) + "\" for \"--" + std::string(flag) + "\" flag");
}

void Apply(CreateOptions& options, const FlagSpec& flag, const std::string& value) {
  const auto name = flag.name;
  if (name == "storage-request") {
    options.request.storage_request = value;
  } else if (name == "storage-limit") {
    options.request.storage_limit = value;
  } else if (name == "access-modes") {
    options.request.access_modes = value;
  } else if (name == "storage-class-name") {
    options.request.storage_class_name = value;
  } else if (name == "namespace") {
    options.namespace_override = value;
  } else if (name == "output") {
    options.output_format = output::ParseOutputFormat(value);
  } else if (name == "config") {
    options.config_path = value;
  } else if (name == "dry-run") {
    options.dry_run = ParseDryRunStrategy(value);
  } else if (name == "save-config") {
    options.save_config = ParseBool(name, value);
  } else if (name == "help") {
    options.help = ParseBool(name, value);
  }
}

// Value given without "=" for a flag that may omit it.
std::string ImplicitValue(const FlagSpec& flag) {
  return flag.kind == FlagKind::kDryRun ? "unchanged" : "true";
}

} // namespace

DryRunStrategy ParseDryRunStrategy(std::string_view value) {
  if (value == "none" || value == "false") {
    return DryRunStrategy::kNone;
  }
  if (value == "client" || value == "true" || value == "unchanged") {
    return DryRunStrategy::kClient;
  }
  if (value == "server") {
    return DryRunStrategy::kServer;
  }
  throw util::UsageError("Invalid dry-run value (" + std::string(value) + "). Must be \"none\", \"server\", or \"client\".");
}

CreateOptions ParseCreateArgs(const std::vector<std::string>& args) {
  CreateOptions            options;
  std::vector<std::string> positional;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];

    if (arg == "--") {
      positional.insert(positional.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
      break;
    }

    if (arg.rfind("--", 0) == 0) {
      const auto  eq   = arg.find('=');
      const auto  name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
      const auto* flag = FindFlag(name);
      if (!flag) {
        throw util::UsageError("unknown flag: --" + name);
      }

      if (eq != std::string::npos) {
        Apply(options, *flag, arg.substr(eq + 1));
      } else if (flag->kind != FlagKind::kString) {
        Apply(options, *flag, ImplicitValue(*flag));
      } else if (i + 1 < args.size()) {
        Apply(options, *flag, args[++i]);
      } else {
        throw util::UsageError("flag needs an argument: --" + name);
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      const auto* flag = FindShorthand(arg[1]);
      if (!flag) {
        throw util::UsageError("unknown shorthand flag: '" + std::string(1, arg[1]) + "' in " + arg);
      }

      if (flag->kind != FlagKind::kString) {
        Apply(options, *flag, ImplicitValue(*flag));
      } else if (arg.size() > 2) {
        const auto value = arg[2] == '=' ? arg.substr(3) : arg.substr(2);
        Apply(options, *flag, value);
      } else if (i + 1 < args.size()) {
        Apply(options, *flag, args[++i]);
      } else {
        const std::string shorthand(1, arg[1]);
        throw util::UsageError("flag needs an argument: '" + shorthand + "' in -" + shorthand);
      }
      continue;
    }

    positional.push_back(arg);
  }

  if (options.help) {
    return options;
  }
  if (positional.size() != 1) {
    throw util::UsageError("exactly one NAME is required, got " + std::to_string(positional.size()));
  }
  options.request.name = positional.front();
  return options;
}

NamespaceContext ResolveNamespace(const CreateOptions& options, const claimctl::runtime::config::RuntimeConfig& config) {
  if (!options.namespace_override.empty()) {
    return {options.namespace_override, true};
  }
  if (!config.context().namespace_().empty()) {
    return {config.context().namespace_(), false};
  }
  return {std::string(kDefaultNamespace), false};
}

std::string OperationFor(DryRunStrategy dry_run) {
  switch (dry_run) {
    case DryRunStrategy::kClient:
      return "created (dry run)";
    case DryRunStrategy::kServer:
      return "created (server dry run)";
    case DryRunStrategy::kNone:
    default:
      return "created";
  }
}

CreateCommand::CreateCommand(claimctl::runtime::config::RuntimeConfig config, store::ClaimStorePtr store)
    : config_(std::move(config)), store_(std::move(store)) {
}

claimctl::v1::PersistentVolumeClaim CreateCommand::Run(const CreateOptions& options, std::ostream& out) const {
  const auto namespace_context = ResolveNamespace(options, config_);

  auto request           = options.request;
  request.namespace_name = namespace_context.namespace_name;

  claim::Validate(request);
  const auto spec   = claim::BuildClaim(request, namespace_context.enforce);
  auto       object = claim::ToProto(spec);
  if (options.save_config) {
    claim::SetLastAppliedConfiguration(object);
  }

  CLAIMCTL_LOG_DEBUG("claim built",
                     {StringField("name", spec.name), StringField("namespace", namespace_context.namespace_name),
                      BoolField("enforce_namespace", namespace_context.enforce),
                      StringField("storage_request", spec.requests.at(std::string(claim::kResourceStorage)).String())});

  if (options.dry_run != DryRunStrategy::kClient) {
    if (!store_) {
      throw std::runtime_error("no claim store configured");
    }

    store::CreateOptions create_options;
    create_options.dry_run = options.dry_run == DryRunStrategy::kServer;

    try {
      object = store_->Create(namespace_context.namespace_name, object, create_options);
    } catch (const util::AlreadyExists& e) {
      throw util::AlreadyExists("failed to create persistentVolumeClaim " + std::string(e.what()));
    } catch (const std::exception& e) {
      throw std::runtime_error("failed to create persistentVolumeClaim " + std::string(e.what()));
    }

    CLAIMCTL_LOG_INFO("claim submitted", {StringField("name", spec.name), StringField("namespace", namespace_context.namespace_name),
                                          BoolField("dry_run", create_options.dry_run)});
  }

  auto printer = output::MakePrinter(options.output_format, OperationFor(options.dry_run));
  printer->Print(object, out);
  return object;
}

} // namespace claimctl::cli
