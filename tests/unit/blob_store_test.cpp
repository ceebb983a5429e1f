#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/storage/blob_store.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/key_utils.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using framecomp::storage::BlobStore;
using framecomp::storage::BlobStorePtr;
using framecomp::storage::StorageFactory;
using framecomp::storage::common::OutputKey;
using framecomp::storage::common::OutputPrefix;
using framecomp::storage::common::SafeProductId;
using framecomp::storage::common::TemplateKey;
using framecomp::storage::common::ToBuffer;
using framecomp::storage::common::ToString;

std::filesystem::path TempRoot(const std::string& name) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("framecomp_blob_" + name + "_" + std::to_string(stamp));
}

void VerifyStore(BlobStore& store) {
  const std::string key = "outputs/p1/sku-1.png";

  assert(!store.Exists(key));
  bool missing = false;
  try {
    store.Read(key);
  } catch (const framecomp::util::NotFound&) {
    missing = true;
  }
  assert(missing);

  store.Write(key, ToBuffer("first"));
  assert(store.Exists(key));
  assert(ToString(store.Read(key)) == "first");

  store.Write(key, ToBuffer("second"));
  assert(ToString(store.Read(key)) == "second");

  store.Write("outputs/p1/sku-2.png", ToBuffer("2"));
  store.Write("outputs/p10/sku-1.png", ToBuffer("other project"));
  store.Write("templates/p1.png", ToBuffer("template"));

  const std::vector<std::string> all_outputs = {"outputs/p1/sku-1.png", "outputs/p1/sku-2.png", "outputs/p10/sku-1.png"};
  assert(store.List("outputs/") == all_outputs);
  assert(store.List("outputs/p1/").size() == 2);
  assert(store.List("templates/") == std::vector<std::string>{"templates/p1.png"});
  assert(store.List("missing/").empty());

  store.RemovePrefix("outputs/p1/");
  assert(!store.Exists(key));
  assert(!store.Exists("outputs/p1/sku-2.png"));
  assert(store.Exists("outputs/p10/sku-1.png"));
  assert(store.Exists("templates/p1.png"));

  store.Remove("templates/p1.png");
  store.Remove("templates/p1.png");
  assert(!store.Exists("templates/p1.png"));
  assert(store.List("outputs/") == std::vector<std::string>{"outputs/p10/sku-1.png"});

  const std::string bad_keys[] = {"", "../etc/passwd", "a//b", "a/./b", "a\\b"};
  for (const auto& bad : bad_keys) {
    bool rejected = false;
    try {
      store.Write(bad, ToBuffer("x"));
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);
  }

  store.Probe();
}

void TestRamStore() {
  framecomp::runtime::config::StorageConfig cfg;
  cfg.mutable_ram();
  auto store = StorageFactory::Build(cfg);
  assert(store->Name() == "ram");
  VerifyStore(*store);
}

void TestDiskStore() {
  auto root = TempRoot("disk");

  framecomp::runtime::config::StorageConfig cfg;
  cfg.mutable_disk()->set_root_path(root.string());
  cfg.mutable_disk()->set_fsync(true);
  auto store = StorageFactory::Build(cfg);
  assert(store->Name() == "disk");
  VerifyStore(*store);

  std::filesystem::remove_all(root);
}

void TestObjectStoreOnLocalPath() {
  auto root = TempRoot("object");
  std::filesystem::create_directories(root);

  framecomp::runtime::config::StorageConfig cfg;
  cfg.mutable_object()->set_uri("file://" + root.string());
  auto store = StorageFactory::Build(cfg);
  VerifyStore(*store);

  std::filesystem::remove_all(root);
}

void TestKeyLayout() {
  assert(TemplateKey("p1", framecomp::v1::IMAGE_FORMAT_PNG) == "templates/p1.png");
  assert(TemplateKey("p1", framecomp::v1::IMAGE_FORMAT_JPEG) == "templates/p1.jpg");
  assert(OutputPrefix("p1") == "outputs/p1/");

  auto key = OutputKey("p1", "SKU 1/../x", framecomp::v1::IMAGE_FORMAT_WEBP);
  assert(key.rfind("outputs/p1/SKU1x-", 0) == 0);
  assert(key.size() > 5 && key.substr(key.size() - 5) == ".webp");

  // sanitised names collide, hashes keep them apart
  assert(SafeProductId("a/b") != SafeProductId("ab"));
  assert(SafeProductId("a/b") == SafeProductId("a/b"));
  assert(SafeProductId("///").rfind("product-", 0) == 0);

  std::string long_id(300, 'z');
  auto        safe = SafeProductId(long_id);
  assert(safe.size() == 50 + 1 + 16);
}

} // namespace

int main() {
  TestRamStore();
  TestDiskStore();
  TestObjectStoreOnLocalPath();
  TestKeyLayout();

  std::cout << "framecomp_unit_blob_store: pass\n";
  return 0;
}
