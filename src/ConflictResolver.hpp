#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include "MovePlanner.hpp"

#include <cstddef>
#include <vector>

constexpr std::size_t kMaxConflictAttempts = 10000;

// Rename entries in place so that no two share a destination and none lands on an
// existing path. Entries are processed in order; the first claimant keeps its name and
// later ones get " (n)" before the extension. No-op entries are left alone.
// Returns the number of entries flagged conflictUnresolved after maxAttempts suffixes.
std::size_t resolveConflicts(std::vector<PlannedMove>& batch, std::size_t maxAttempts = kMaxConflictAttempts);

#endif
