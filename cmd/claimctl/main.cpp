#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/create_command.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/store_factory.hpp"
#include "internal/util/errors.hpp"

using claimctl::cli::CreateCommand;
using claimctl::cli::CreateOptions;

static void Usage() {
  std::cout << "Create a persistentvolumeclaim with the specified name.\n\n"
            << "Usage:\n"
            << "  claimctl [--config <path>] create persistentvolumeclaim NAME --storage-request=<quantity> [options]\n\n"
            << "Aliases:\n"
            << "  persistentvolumeclaim, pvc\n\n"
            << "Examples:\n"
            << "  # Create a persistentvolumeclaim\n"
            << "  claimctl create persistentvolumeclaim my-pvc --storage-request=1Gi\n\n"
            << "  # Create a persistentvolumeclaim with a resource limit\n"
            << "  claimctl create persistentvolumeclaim my-pvc --storage-request=500Mi --storage-limit=1Gi\n\n"
            << "  # Create a persistentvolumeclaim with an access mode\n"
            << "  claimctl create persistentvolumeclaim my-pvc --storage-request=500Mi --access-modes=ReadWriteOnce\n\n"
            << "Options:\n"
            << "  --storage-request=<q>       Storage request capacity for the pvc (required)\n"
            << "  --storage-limit=<q>         Storage limit capacity for the pvc\n"
            << "  --access-modes=m1,m2        Access modes: ReadOnlyMany, ReadWriteMany, ReadWriteOnce\n"
            << "  --storage-class-name=<s>    Storage class name that pvc will use\n"
            << "  -n, --namespace=<ns>        Namespace to create the pvc in\n"
            << "  --dry-run[=none|client|server]\n"
            << "  -o, --output=json|yaml|name\n"
            << "  --save-config               Record the object in the last-applied-configuration annotation\n"
            << "  --config=<path>             Config file (default $CLAIMCTL_CONFIG or ~/.claimctl/config.yaml)\n";
}

static bool IsClaimResource(const std::string& resource) {
  return resource == "persistentvolumeclaim" || resource == "pvc";
}

// Moves global "--config <path>" / "--config=<path>" arguments ahead of the
// subcommand into the subcommand's own flags.
static std::vector<std::string> HoistGlobalFlags(std::vector<std::string> args, std::vector<std::string>& forwarded) {
  while (!args.empty() && args[0].rfind("--config", 0) == 0) {
    if (args[0].rfind("--config=", 0) == 0) {
      forwarded.push_back(args[0]);
      args.erase(args.begin());
    } else if (args[0] == "--config" && args.size() > 1) {
      forwarded.push_back("--config=" + args[1]);
      args.erase(args.begin(), args.begin() + 2);
    } else {
      break;
    }
  }
  return args;
}

int main(int argc, char** argv) {
  std::vector<std::string> global_flags;
  const auto args = HoistGlobalFlags(std::vector<std::string>(argv + 1, argv + argc), global_flags);
  if (args.size() == 1 && (args[0] == "-h" || args[0] == "--help")) {
    Usage();
    return 0;
  }
  if (args.size() < 2 || args[0] != "create" || !IsClaimResource(args[1])) {
    Usage();
    return 1;
  }

  std::vector<std::string> create_args(args.begin() + 2, args.end());
  create_args.insert(create_args.begin(), global_flags.begin(), global_flags.end());

  CreateOptions options;
  try {
    options = claimctl::cli::ParseCreateArgs(create_args);
  } catch (const claimctl::util::UsageError& e) {
    std::cerr << "error: " << e.what() << "\n"
              << "See 'claimctl create persistentvolumeclaim --help' for usage.\n";
    return 1;
  }
  if (options.help) {
    Usage();
    return 0;
  }

  claimctl::runtime::config::RuntimeConfig config;
  try {
    config = claimctl::config::ConfigLoader::Load(options.config_path);
    claimctl::observability::InitializeLogging(config);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  try {
    CreateCommand command(config, claimctl::store::StoreFactory::Build(config.store()));
    command.Run(options, std::cout);
  } catch (const std::exception& e) {
    CLAIMCTL_LOG_DEBUG("create failed", {claimctl::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    claimctl::observability::ShutdownLogging();
    return 1;
  }

  claimctl::observability::ShutdownLogging();
  return 0;
}
