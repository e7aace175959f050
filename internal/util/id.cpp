#include "id.hpp"

#include <algorithm>
#include <random>

namespace swarm::util {

namespace {
constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
}

std::string ToBase36(uint64_t value) {
  if (value == 0) return "0";

  std::string out;
  while (value > 0) {
    out.push_back(kDigits[value % 36]);
    value /= 36;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

uint64_t Fnv1a64(const std::string& text) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::string GenerateCellId(const std::string& prefix, const std::string& project_key, int64_t now_ms) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string hash = ToBase36(Fnv1a64(project_key));
  hash.resize(6, '0');

  std::string random;
  for (int i = 0; i < 3; ++i) {
    random.push_back(kDigits[rng() % 36]);
  }

  const std::string& p = prefix.empty() ? std::string("cell") : prefix;
  return p + "-" + hash + "-" + ToBase36(static_cast<uint64_t>(now_ms)) + random;
}

} // namespace swarm::util
