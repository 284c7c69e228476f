#include "internal/storage/chunk_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace mediacache::storage {

using namespace mediacache::storage::common;

namespace {

constexpr uint64_t    kProbeSize     = 16ull * 1024 * 1024;
constexpr std::size_t kZeroFillBlock = 1024 * 1024;

[[noreturn]] void ThrowErrno(const std::string& what, const std::string& path, int err) {
  if (err == ENOSPC || err == EDQUOT) {
    throw util::StorageError("disk full: " + what + " " + path);
  }
  throw util::StorageError(what + " " + path + ": " + std::strerror(err));
}

/*
  Owning POSIX file descriptor.
*/
class FileDescriptor {
 public:
  FileDescriptor(const std::string& path, int flags) : path_(path), fd_(::open(path.c_str(), flags | O_CLOEXEC, 0644)) {
    if (fd_ < 0) ThrowErrno("open", path_, errno);
  }

  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  void PWriteAll(uint64_t offset, const uint8_t* data, std::size_t size) {
    while (size > 0) {
      const ssize_t n = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
      if (n < 0) {
        if (errno == EINTR) continue;
        ThrowErrno("write", path_, errno);
      }
      data += n;
      offset += static_cast<uint64_t>(n);
      size -= static_cast<std::size_t>(n);
    }
  }

  void DataSync() {
    if (::fdatasync(fd_) != 0) ThrowErrno("fdatasync", path_, errno);
  }

  uint64_t Size() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) ThrowErrno("stat", path_, errno);
    return static_cast<uint64_t>(st.st_size);
  }

  void Truncate(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) ThrowErrno("extend", path_, errno);
  }

  uint64_t AllocatedBytes() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) ThrowErrno("stat", path_, errno);
    return static_cast<uint64_t>(st.st_blocks) * 512;
  }

 private:
  std::string path_;
  int         fd_;
};

} // namespace

ChunkStore::ChunkStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

AllocationMode ChunkStore::Mode() {
  std::call_once(probe_once_, [this] { mode_ = ProbeAllocationMode(); });
  return mode_;
}

AllocationMode ChunkStore::ProbeAllocationMode() {
  const auto probe_path = (root_ / ".sparse-probe").string();

  AllocationMode mode = AllocationMode::kPreallocated;
  {
    FileDescriptor probe(probe_path, O_RDWR | O_CREAT | O_TRUNC);
    probe.Truncate(kProbeSize);
    if (probe.AllocatedBytes() < kProbeSize) mode = AllocationMode::kSparse;
  }

  std::error_code ec;
  std::filesystem::remove(probe_path, ec);

  MEDIACACHE_LOG_INFO("Chunk store allocation probed", {observability::StringField("root", root_.string()),
                                                        observability::BoolField("sparse", mode == AllocationMode::kSparse)});
  return mode;
}

void ChunkStore::OpenOrCreate(const db::model::CacheEntryRecord& entry) {
  if (entry.file_path.empty()) throw util::InvalidState("cache entry " + std::to_string(entry.id) + " has no file path");

  FileDescriptor file(entry.file_path, O_RDWR | O_CREAT);
  if (!entry.expected_total_size) return;

  const uint64_t target  = *entry.expected_total_size;
  const uint64_t current = file.Size();
  if (current >= target) return;

  if (Mode() == AllocationMode::kSparse) {
    file.Truncate(target);
    return;
  }

  const std::vector<uint8_t> zeros(kZeroFillBlock, 0);
  for (uint64_t offset = current; offset < target;) {
    const auto n = static_cast<std::size_t>(std::min<uint64_t>(kZeroFillBlock, target - offset));
    file.PWriteAll(offset, zeros.data(), n);
    offset += n;
  }
  file.DataSync();
}

void ChunkStore::Write(const db::model::CacheEntryRecord& entry, uint64_t offset, const uint8_t* data, std::size_t size, bool fsync) {
  FileDescriptor file(entry.file_path, O_WRONLY | O_CREAT);
  file.PWriteAll(offset, data, size);
  if (fsync) file.DataSync();
}

std::shared_ptr<arrow::Buffer> ChunkStore::Read(const db::model::CacheEntryRecord& entry, uint64_t offset, uint64_t length) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(entry.file_path));
  auto buffer = Unwrap(file->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length)));
  Unwrap(file->Close());

  if (static_cast<uint64_t>(buffer->size()) != length) {
    throw util::StorageError("short read from " + entry.file_path + " at offset " + std::to_string(offset) + ": wanted " +
                             std::to_string(length) + " got " + std::to_string(buffer->size()));
  }
  return buffer;
}

void ChunkStore::Remove(const db::model::CacheEntryRecord& entry) {
  std::error_code ec;
  std::filesystem::remove(entry.file_path, ec);
  if (ec) throw util::StorageError("remove " + entry.file_path + ": " + ec.message());
}

} // namespace mediacache::storage
