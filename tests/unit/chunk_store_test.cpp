#include "internal/storage/chunk_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using mediacache::db::model::CacheEntryRecord;
using mediacache::storage::ChunkStore;

std::filesystem::path FreshRoot(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() /
              ("mediacache_chunk_store_" + name + "_" + std::to_string(mediacache::util::NowMs()));
  std::filesystem::remove_all(root);
  return root;
}

CacheEntryRecord MakeEntry(const std::filesystem::path& root, uint64_t id, std::optional<uint64_t> size) {
  CacheEntryRecord entry;
  entry.id                  = id;
  entry.file_path           = (root / (std::to_string(id) + ".cache")).string();
  entry.expected_total_size = size;
  return entry;
}

void TestOpenOrCreateExtendsToExpectedSize() {
  const auto root = FreshRoot("extend");
  ChunkStore store(root);

  auto entry = MakeEntry(root, 1, 3 * 1024 * 1024);
  store.OpenOrCreate(entry);
  assert(std::filesystem::file_size(entry.file_path) == 3 * 1024 * 1024);

  std::filesystem::remove_all(root);
}

void TestUnknownSizeCreatesEmptyFileThenExtends() {
  const auto root = FreshRoot("unknown");
  ChunkStore store(root);

  auto entry = MakeEntry(root, 2, std::nullopt);
  store.OpenOrCreate(entry);
  assert(std::filesystem::exists(entry.file_path));
  assert(std::filesystem::file_size(entry.file_path) == 0);

  entry.expected_total_size = 4096;
  store.OpenOrCreate(entry);
  assert(std::filesystem::file_size(entry.file_path) == 4096);

  std::filesystem::remove_all(root);
}

void TestWriteThenReadAtOffsets() {
  const auto root = FreshRoot("rw");
  ChunkStore store(root);

  auto entry = MakeEntry(root, 3, 1000);
  store.OpenOrCreate(entry);

  std::vector<uint8_t> tail(100);
  for (size_t i = 0; i < tail.size(); ++i) tail[i] = static_cast<uint8_t>(i);
  store.Write(entry, 900, tail.data(), tail.size(), true);

  std::vector<uint8_t> head(10, 0xAB);
  store.Write(entry, 0, head.data(), head.size(), false);

  auto buffer = store.Read(entry, 900, 100);
  assert(buffer->size() == 100);
  for (int64_t i = 0; i < buffer->size(); ++i) assert(buffer->data()[i] == static_cast<uint8_t>(i));

  buffer = store.Read(entry, 0, 10);
  assert(buffer->data()[0] == 0xAB && buffer->data()[9] == 0xAB);

  std::filesystem::remove_all(root);
}

void TestReopenKeepsData() {
  const auto root = FreshRoot("reopen");
  auto       entry = MakeEntry(root, 4, 64);
  {
    ChunkStore           store(root);
    std::vector<uint8_t> data(64, 0x5A);
    store.OpenOrCreate(entry);
    store.Write(entry, 0, data.data(), data.size(), true);
  }

  ChunkStore store(root);
  store.OpenOrCreate(entry);
  auto buffer = store.Read(entry, 0, 64);
  assert(buffer->data()[0] == 0x5A && buffer->data()[63] == 0x5A);

  std::filesystem::remove_all(root);
}

void TestShortReadThrowsStorageError() {
  const auto root = FreshRoot("short");
  ChunkStore store(root);

  auto entry = MakeEntry(root, 5, 16);
  store.OpenOrCreate(entry);

  bool threw = false;
  try {
    (void)store.Read(entry, 8, 64);
  } catch (const mediacache::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(root);
}

void TestRemoveDeletesFile() {
  const auto root = FreshRoot("remove");
  ChunkStore store(root);

  auto entry = MakeEntry(root, 6, 16);
  store.OpenOrCreate(entry);
  store.Remove(entry);
  assert(!std::filesystem::exists(entry.file_path));

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestOpenOrCreateExtendsToExpectedSize();
  TestUnknownSizeCreatesEmptyFileThenExtends();
  TestWriteThenReadAtOffsets();
  TestReopenKeepsData();
  TestShortReadThrowsStorageError();
  TestRemoveDeletesFile();

  std::cout << "mediacache_unit_chunk_store: pass\n";
  return 0;
}
