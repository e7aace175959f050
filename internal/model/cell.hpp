#pragma once

#include <array>
#include <string_view>

namespace swarm::model {

/*
  Cell vocabulary shared by validation, projections and the export file.
*/

inline constexpr std::string_view kStatusOpen       = "open";
inline constexpr std::string_view kStatusInProgress = "in_progress";
inline constexpr std::string_view kStatusBlocked    = "blocked";
inline constexpr std::string_view kStatusClosed     = "closed";

// Export-only status for soft-deleted cells.
inline constexpr std::string_view kStatusTombstone = "tombstone";

inline constexpr std::array<std::string_view, 4> kStatuses = {kStatusOpen, kStatusInProgress, kStatusBlocked,
                                                              kStatusClosed};

inline constexpr std::array<std::string_view, 5> kIssueTypes = {"bug", "feature", "task", "epic", "chore"};

inline constexpr std::array<std::string_view, 8> kRelationships = {
    "blocks", "related", "parent-child", "discovered-from", "replies-to", "relates-to", "duplicates", "supersedes"};

inline constexpr int kMinPriority     = 0;
inline constexpr int kMaxPriority     = 3;
inline constexpr int kDefaultPriority = 2;

template <std::size_t N>
constexpr bool Contains(const std::array<std::string_view, N>& values, std::string_view value) {
  for (auto v : values) {
    if (v == value) return true;
  }
  return false;
}

constexpr bool IsValidStatus(std::string_view status) {
  return Contains(kStatuses, status);
}

constexpr bool IsValidIssueType(std::string_view type) {
  return Contains(kIssueTypes, type);
}

constexpr bool IsValidRelationship(std::string_view relationship) {
  return Contains(kRelationships, relationship);
}

constexpr bool IsValidPriority(int priority) {
  return priority >= kMinPriority && priority <= kMaxPriority;
}

// A dependency target keeps its dependents blocked while this holds.
constexpr bool IsOpenBlocker(std::string_view status, bool deleted) {
  return status != kStatusClosed && !deleted;
}

} // namespace swarm::model
