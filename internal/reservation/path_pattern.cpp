#include "path_pattern.hpp"

#include <vector>

namespace swarm::reservation {

namespace {

// Each (pattern index, path index) state is decided once, so runs of "**"
// stay polynomial in the path length.
class Matcher {
 public:
  Matcher(const std::string& p, const std::string& s)
      : p_(p), s_(s), memo_((p.size() + 1) * (s.size() + 1), kUnknown) {}

  bool From(std::size_t pi, std::size_t si) {
    auto& slot = memo_[pi * (s_.size() + 1) + si];
    if (slot == kUnknown) slot = Compute(pi, si) ? kYes : kNo;
    return slot == kYes;
  }

 private:
  static constexpr signed char kUnknown = -1;
  static constexpr signed char kNo      = 0;
  static constexpr signed char kYes     = 1;

  bool Compute(std::size_t pi, std::size_t si) {
    const auto& p = p_;
    const auto& s = s_;
    while (pi < p.size()) {
      const char c = p[pi];

      if (c == '*' && pi + 1 < p.size() && p[pi + 1] == '*') {
        pi += 2;
        if (pi < p.size() && p[pi] == '/') {
          // "**/" may stand for zero segments
          if (From(pi + 1, si)) return true;
        }
        for (std::size_t k = si; k <= s.size(); ++k) {
          if (From(pi, k)) return true;
        }
        return false;
      }

      if (c == '*') {
        ++pi;
        for (std::size_t k = si;; ++k) {
          if (From(pi, k)) return true;
          if (k == s.size() || s[k] == '/') return false;
        }
      }

      if (si == s.size()) return false;
      if (c == '?') {
        if (s[si] == '/') return false;
      } else if (c != s[si]) {
        return false;
      }
      ++pi;
      ++si;
    }
    return si == s.size();
  }

  const std::string&       p_;
  const std::string&       s_;
  std::vector<signed char> memo_;
};

} // namespace

bool IsGlob(const std::string& pattern) {
  return pattern.find_first_of("*?") != std::string::npos;
}

bool GlobMatch(const std::string& pattern, const std::string& path) {
  if (pattern == path) return true;
  return Matcher(pattern, path).From(0, 0);
}

std::string StaticPrefix(const std::string& pattern) {
  return pattern.substr(0, pattern.find_first_of("*?"));
}

bool PatternsOverlap(const std::string& a, const std::string& b) {
  if (a == b) return true;
  if (GlobMatch(a, b) || GlobMatch(b, a)) return true;

  if (IsGlob(a) && IsGlob(b)) {
    const auto pa = StaticPrefix(a);
    const auto pb = StaticPrefix(b);
    return pa.compare(0, pb.size(), pb) == 0 || pb.compare(0, pa.size(), pa) == 0;
  }
  return false;
}

} // namespace swarm::reservation
