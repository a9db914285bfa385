#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "claimctl/v1.hpp"
#include "config/config.pb.h"
#include "internal/claim/claim_request.hpp"
#include "internal/output/printer.hpp"
#include "internal/store/claim_store.hpp"

namespace claimctl::cli {

enum class DryRunStrategy : std::uint8_t {
  kNone   = 0,
  kClient = 1,
  kServer = 2,
};

/*
  "none", "client", "server", plus the legacy "true" (client) and "false"
  (none). "unchanged" is what a bare --dry-run produces and means client.
*/
DryRunStrategy ParseDryRunStrategy(std::string_view value);

struct CreateOptions {
  claim::ClaimRequest request;

  // --namespace; empty when not given.
  std::string namespace_override;
  std::string config_path;

  DryRunStrategy       dry_run       = DryRunStrategy::kNone;
  output::OutputFormat output_format = output::OutputFormat::kDefault;
  bool                 save_config   = false;
  bool                 help          = false;
};

/*
  Parses the arguments following "create persistentvolumeclaim".

  Flags take "--flag=value" or "--flag value"; -n and -o also take
  "-nvalue". Exactly one positional NAME is required unless --help is given.
  Throws util::UsageError.
*/
CreateOptions ParseCreateArgs(const std::vector<std::string>& args);

struct NamespaceContext {
  std::string namespace_name;
  // True only when the user named the namespace explicitly.
  bool enforce = false;
};

NamespaceContext ResolveNamespace(const CreateOptions& options, const claimctl::runtime::config::RuntimeConfig& config);

std::string OperationFor(DryRunStrategy dry_run);

/*
  create persistentvolumeclaim

  Flow:
      resolve namespace → validate → build → annotate → submit → print

  Client dry runs never reach the store. Every error propagates; store
  failures are prefixed with "failed to create persistentVolumeClaim".
*/
class CreateCommand {
 public:
  CreateCommand(claimctl::runtime::config::RuntimeConfig config, store::ClaimStorePtr store);

  // Returns the object that was printed.
  claimctl::v1::PersistentVolumeClaim Run(const CreateOptions& options, std::ostream& out) const;

 private:
  claimctl::runtime::config::RuntimeConfig config_;
  store::ClaimStorePtr                     store_;
};

} // namespace claimctl::cli
