#include "disk_claim_store.hpp"

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/claim/claim_codec.hpp"
#include "internal/store/common/errors.hpp"
#include "internal/store/common/path_utils.hpp"

namespace claimctl::store {

using namespace claimctl::store::common;
using claimctl::v1::PersistentVolumeClaim;

namespace {

// Unique per process and per call, so concurrent writers never share a file.
std::filesystem::path TempPathFor(const std::filesystem::path& final_path) {
  static std::atomic<std::uint64_t> counter{0};
  return final_path.string() + "." + std::to_string(::getpid()) + "." + std::to_string(counter.fetch_add(1)) + ".tmp";
}

// Removes the temp file on every exit path; publishing links it elsewhere first.
class TempFileGuard {
public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
  ~TempFileGuard() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace

DiskClaimStore::DiskClaimStore(std::filesystem::path root)
    : root_(std::move(root)) {}

/*
  Exclusive publish:
      write unique tmp → flush → hard link to final → unlink tmp

  Linking fails when the final path exists, so of two concurrent creates for
  the same claim exactly one wins. A dry run stops after the existence check.
*/
PersistentVolumeClaim DiskClaimStore::Create(const std::string& namespace_name,
                                             const PersistentVolumeClaim& claim,
                                             const CreateOptions& options) {

  const auto& name = claim.metadata().name();
  auto final_path = ClaimPath(root_, namespace_name, name);

  if (std::filesystem::exists(final_path))
    throw ClaimAlreadyExists(name);

  PersistentVolumeClaim stored = claim;
  stored.mutable_metadata()->set_namespace_(namespace_name);

  if (options.dry_run)
    return stored;

  std::filesystem::create_directories(final_path.parent_path());
  TempFileGuard tmp(TempPathFor(final_path));

  {
    std::ofstream out(tmp.path(), std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error("failed to open " + tmp.path().string());

    out << claim::ToJson(stored, true) << '\n';
    out.flush();
    if (!out)
      throw std::runtime_error("failed to write " + tmp.path().string());
  }

  std::error_code ec;
  std::filesystem::create_hard_link(tmp.path(), final_path, ec);
  if (ec == std::errc::file_exists)
    throw ClaimAlreadyExists(name);
  if (ec)
    throw std::filesystem::filesystem_error("failed to publish claim", tmp.path(), final_path, ec);

  return stored;
}

std::optional<PersistentVolumeClaim> DiskClaimStore::Get(const std::string& namespace_name,
                                                         const std::string& name) {

  auto path = ClaimPath(root_, namespace_name, name);

  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::nullopt;

  std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return claim::FromJson(json);
}

} // namespace claimctl::store
