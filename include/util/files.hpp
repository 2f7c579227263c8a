// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include "util/op_state.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace notekeep {
namespace util {

/**
 * Atomic file operations for crash-safe persistence
 *
 * Pattern:
 * 1. Create the parent directory if missing
 * 2. Write to a temporary file in the same directory (<name>.tmp.<hex>)
 * 3. fsync() the file to ensure data is on disk
 * 4. Atomic rename over the original file
 * 5. fsync() the directory so the rename itself is durable
 *
 * This ensures that either the old file or new file is always valid,
 * never a half-written corrupted file. The temp file must live in the
 * target's directory: rename() is only atomic within one filesystem.
 *
 * No locking is done here. Concurrent writers to the same path each
 * leave a complete file behind; ordering between them is the caller's
 * problem.
 */

/**
 * Write data to file atomically with custom permissions
 * @param path Target file path
 * @param data Data to write
 * @param mode File permissions (e.g., 0600 for owner-only, 0644 for default)
 * @param state Receives ErrorKind::IOFailure with the failing step and path
 * Returns true on success. On failure the target is left untouched.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data, int mode,
                       OpState &state);

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode, OpState &state);

/**
 * Write string to file atomically (0644), reporting failure detail
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, OpState &state);

/**
 * Convenience overloads that only report success or failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data);
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode);

/**
 * Stages at which a write can be made to stop as if the process crashed.
 * The temp file is abandoned in place and the target is not renamed.
 */
enum class AtomicWriteCrashPoint {
  None,
  BeforeWrite, // temp file created, nothing written
  AfterWrite,  // content written, not yet synced
  AfterSync,   // content synced, rename not performed
};

void SetAtomicWriteCrashPointForTest(AtomicWriteCrashPoint point);
void ResetAtomicWriteCrashPointForTest();

/**
 * Read entire file into vector
 * Returns empty vector on failure
 */
std::vector<uint8_t> read_file(const std::filesystem::path &path);

/**
 * Read entire file into string
 * Returns empty string on failure
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * Returns ~/.notekeep
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace notekeep
