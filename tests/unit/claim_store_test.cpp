#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/store/disk/disk_claim_store.hpp"
#include "internal/store/memory/memory_claim_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using claimctl::store::CreateOptions;
using claimctl::store::DiskClaimStore;
using claimctl::store::MemoryClaimStore;
using claimctl::v1::PersistentVolumeClaim;

std::filesystem::path TestRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "claimctl_claim_store_tests" / test_name;
  std::filesystem::remove_all(root);
  return root;
}

std::size_t CountTempFiles(const std::filesystem::path& dir) {
  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().extension() == ".tmp") {
      ++count;
    }
  }
  return count;
}

PersistentVolumeClaim MakeClaim(const std::string& name) {
  PersistentVolumeClaim claim;
  claim.set_api_version("v1");
  claim.set_kind("PersistentVolumeClaim");
  claim.mutable_metadata()->set_name(name);
  (*claim.mutable_spec()->mutable_resources()->mutable_requests())["storage"] = "5Gi";
  return claim;
}

template <typename Fn>
bool ThrowsAlreadyExists(Fn&& fn) {
  try {
    fn();
  } catch (const claimctl::util::AlreadyExists& e) {
    return std::string(e.what()) == "persistentvolumeclaims \"test-pvc\" already exists";
  }
  return false;
}

void TestDiskCreateWritesDocument() {
  const auto     root = TestRoot("create");
  DiskClaimStore store(root);

  const auto stored = store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{});
  assert(stored.metadata().namespace_() == "team-a");
  assert(std::filesystem::is_regular_file(root / "team-a" / "test-pvc.json"));
  assert(CountTempFiles(root / "team-a") == 0);

  const auto loaded = store.Get("team-a", "test-pvc");
  assert(loaded.has_value());
  assert(loaded->metadata().namespace_() == "team-a");
  assert(loaded->spec().resources().requests().at("storage") == "5Gi");

  assert(!store.Get("team-b", "test-pvc").has_value());
}

void TestDiskDuplicateIsRejected() {
  DiskClaimStore store(TestRoot("duplicate"));
  (void)store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{});

  assert(ThrowsAlreadyExists([&] { (void)store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{}); }));

  CreateOptions dry_run;
  dry_run.dry_run = true;
  assert(ThrowsAlreadyExists([&] { (void)store.Create("team-a", MakeClaim("test-pvc"), dry_run); }));

  // Same name in another namespace is a different claim.
  (void)store.Create("team-b", MakeClaim("test-pvc"), CreateOptions{});
}

void TestDiskConcurrentCreatesHaveOneWinner() {
  const auto root = TestRoot("concurrent");

  for (int round = 0; round < 200; ++round) {
    const auto name = "pvc-" + std::to_string(round);

    // Separate stores model separate claimctl processes sharing one root.
    DiskClaimStore first(root);
    DiskClaimStore second(root);

    bool first_ok  = false;
    bool second_ok = false;
    auto attempt   = [&name](DiskClaimStore& store, bool& ok) {
      try {
        (void)store.Create("default", MakeClaim(name), CreateOptions{});
        ok = true;
      } catch (const claimctl::util::AlreadyExists&) {
        ok = false;
      }
    };

    std::thread a([&] { attempt(first, first_ok); });
    std::thread b([&] { attempt(second, second_ok); });
    a.join();
    b.join();

    assert(first_ok != second_ok);
    assert(first.Get("default", name).has_value());
  }

  assert(CountTempFiles(root / "default") == 0);
}

void TestDiskDuplicateLeavesNoTempFiles() {
  const auto     root = TestRoot("no_temp_files");
  DiskClaimStore store(root);

  (void)store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{});
  assert(ThrowsAlreadyExists([&] { (void)store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{}); }));

  assert(CountTempFiles(root / "team-a") == 0);
}

void TestDiskDryRunPersistsNothing() {
  const auto     root = TestRoot("dry_run");
  DiskClaimStore store(root);

  CreateOptions options;
  options.dry_run   = true;
  const auto stored = store.Create("team-a", MakeClaim("test-pvc"), options);

  assert(stored.metadata().namespace_() == "team-a");
  assert(!std::filesystem::exists(root));
  assert(!store.Get("team-a", "test-pvc").has_value());
}

void TestDiskRejectsPathLikeNames() {
  DiskClaimStore store(TestRoot("path_names"));

  for (const auto* name : {"../escape", "a/b", "..", ""}) {
    bool threw = false;
    try {
      (void)store.Create("team-a", MakeClaim(name), CreateOptions{});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestMemoryStore() {
  MemoryClaimStore store;

  CreateOptions dry_run;
  dry_run.dry_run = true;
  (void)store.Create("team-a", MakeClaim("test-pvc"), dry_run);
  assert(store.Size() == 0);

  const auto stored = store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{});
  assert(stored.metadata().namespace_() == "team-a");
  assert(store.Size() == 1);
  assert(store.Get("team-a", "test-pvc").has_value());

  assert(ThrowsAlreadyExists([&] { (void)store.Create("team-a", MakeClaim("test-pvc"), CreateOptions{}); }));
  assert(store.Size() == 1);
}

} // namespace

int main() {
  TestDiskCreateWritesDocument();
  TestDiskDuplicateIsRejected();
  TestDiskConcurrentCreatesHaveOneWinner();
  TestDiskDuplicateLeavesNoTempFiles();
  TestDiskDryRunPersistsNothing();
  TestDiskRejectsPathLikeNames();
  TestMemoryStore();

  std::cout << "claimctl_unit_claim_store: pass\n";
  return 0;
}
