// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <pwd.h>
#include <random>
#include <unistd.h>

namespace notekeep {
namespace util {

namespace {

std::atomic<AtomicWriteCrashPoint> g_crash_point{AtomicWriteCrashPoint::None};

constexpr int MAX_TEMP_NAME_ATTEMPTS = 8;

bool crash_here(AtomicWriteCrashPoint point) {
  return g_crash_point.load(std::memory_order_relaxed) == point;
}

std::string errno_string() { return std::strerror(errno); }

// Sync directory to make a completed rename durable
bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

// Generate random suffix for temp file
// Uses thread_local static to avoid expensive RNG recreation
std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

// Remove an abandoned temp file; the original error is what gets reported
void discard_temp(const std::filesystem::path &temp_path) {
  std::error_code ec;
  std::filesystem::remove(temp_path, ec);
  if (ec) {
    LOG_FILES_WARN("failed to remove temp file {}: {}", temp_path.string(),
                   ec.message());
  }
}

bool write_all(int fd, const std::vector<uint8_t> &data) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      if (n == 0) {
        errno = EIO;
      }
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data, int mode,
                       OpState &state) {
  if (path.empty() || !path.has_filename()) {
    return state.Fail(ErrorKind::IOFailure, "invalid target path",
                      path.string());
  }

  // Create parent directory if needed
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_FILES_ERROR("cannot create directory {}", parent.string());
    return state.Fail(ErrorKind::IOFailure, path.string(),
                      "cannot create parent directory");
  }

  // Open a fresh temp file next to the target
  std::filesystem::path temp_path;
  int fd = -1;
  for (int attempt = 0; attempt < MAX_TEMP_NAME_ATTEMPTS && fd < 0;
       ++attempt) {
    temp_path = path;
    temp_path += ".tmp." + random_suffix();
    fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
              mode);
    if (fd < 0 && errno != EEXIST) {
      break;
    }
  }
  if (fd < 0) {
    std::string reason = errno_string();
    LOG_FILES_ERROR("cannot create temp file for {}: {}", path.string(),
                    reason);
    return state.Fail(ErrorKind::IOFailure, path.string(),
                      "create temp file: " + reason);
  }

  if (crash_here(AtomicWriteCrashPoint::BeforeWrite)) {
    close(fd);
    return state.Fail(ErrorKind::IOFailure, path.string(),
                      "simulated crash before write");
  }

  // Write data (handle partial writes)
  if (!write_all(fd, data)) {
    std::string reason = errno_string();
    close(fd);
    discard_temp(temp_path);
    LOG_FILES_ERROR("write to {} failed: {}", temp_path.string(), reason);
    return state.Fail(ErrorKind::IOFailure, path.string(), "write: " + reason);
  }

  if (crash_here(AtomicWriteCrashPoint::AfterWrite)) {
    close(fd);
    return state.Fail(ErrorKind::IOFailure, path.string(),
                      "simulated crash after write");
  }

  // Data must be on the device before the rename becomes visible
  if (fsync(fd) != 0) {
    std::string reason = errno_string();
    close(fd);
    discard_temp(temp_path);
    LOG_FILES_ERROR("fsync of {} failed: {}", temp_path.string(), reason);
    return state.Fail(ErrorKind::IOFailure, path.string(), "fsync: " + reason);
  }

  if (close(fd) != 0) {
    std::string reason = errno_string();
    discard_temp(temp_path);
    LOG_FILES_ERROR("close of {} failed: {}", temp_path.string(), reason);
    return state.Fail(ErrorKind::IOFailure, path.string(), "close: " + reason);
  }

  if (crash_here(AtomicWriteCrashPoint::AfterSync)) {
    return state.Fail(ErrorKind::IOFailure, path.string(),
                      "simulated crash before rename");
  }

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    discard_temp(temp_path);
    LOG_FILES_ERROR("rename {} -> {} failed: {}", temp_path.string(),
                    path.string(), ec.message());
    return state.Fail(ErrorKind::IOFailure, path.string(),
                      "rename: " + ec.message());
  }

  // The new content is already in place; a failed directory sync only
  // weakens durability of the rename across power loss
  auto dir = parent.empty() ? std::filesystem::path(".") : parent;
  if (!sync_directory(dir)) {
    LOG_FILES_WARN("directory sync of {} failed: {}", dir.string(),
                   errno_string());
  }

  LOG_FILES_DEBUG("wrote {} bytes to {}", data.size(), path.string());
  return true;
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode, OpState &state) {
  std::vector<uint8_t> vec(data.begin(), data.end());
  return atomic_write_file(path, vec, mode, state);
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, OpState &state) {
  return atomic_write_file(path, data, 0644, state);
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data) {
  OpState state;
  return atomic_write_file(path, data, 0644, state);
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  OpState state;
  return atomic_write_file(path, data, 0644, state);
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  OpState state;
  return atomic_write_file(path, data, mode, state);
}

void SetAtomicWriteCrashPointForTest(AtomicWriteCrashPoint point) {
  g_crash_point.store(point, std::memory_order_relaxed);
}

void ResetAtomicWriteCrashPointForTest() {
  g_crash_point.store(AtomicWriteCrashPoint::None, std::memory_order_relaxed);
}

std::vector<uint8_t> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return {};
  }

  // Get file size with proper error checking
  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return {};
  }

  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size < 0) {
    return {};
  }

  // Refuse to read files larger than 100MB
  constexpr std::streamsize MAX_FILE_SIZE = 100 * 1024 * 1024;
  if (size > MAX_FILE_SIZE) {
    LOG_FILES_WARN("refusing to read {} ({} bytes)", path.string(), size);
    return {};
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char *>(data.data()), size);

  if (!file) {
    return {};
  }

  return data;
}

std::string read_file_string(const std::filesystem::path &path) {
  auto data = read_file(path);
  return std::string(data.begin(), data.end());
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (!ec) {
    return true;
  }
  std::error_code is_dir_ec;
  return std::filesystem::is_directory(dir, is_dir_ec);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }

  if (home) {
    return std::filesystem::path(home) / ".notekeep";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".notekeep";
}

} // namespace util
} // namespace notekeep
