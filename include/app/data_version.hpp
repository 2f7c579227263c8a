// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include <compare>
#include <cstdint>

namespace notekeep {
namespace app {

/**
 * Caller-owned change counter for the note store
 *
 * Starts at 0 for each process and is not persisted. Every successful
 * insert, update or delete produces Next(); a dependent view re-reads the
 * store whenever the latest value differs from the one it last rendered.
 * Held by value and passed through the interaction loop, never global.
 */
class DataVersion {
public:
  constexpr DataVersion() = default;
  constexpr explicit DataVersion(uint64_t value) : value_(value) {}

  constexpr uint64_t value() const { return value_; }
  constexpr DataVersion Next() const { return DataVersion(value_ + 1); }

  constexpr auto operator<=>(const DataVersion &) const = default;

private:
  uint64_t value_{0};
};

} // namespace app
} // namespace notekeep
