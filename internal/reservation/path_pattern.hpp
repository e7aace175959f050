#pragma once

#include <string>

namespace swarm::reservation {

/*
  Path patterns:

    *   any run of characters inside one segment
    **  any number of whole segments, including none
    ?   one character other than '/'

  Anything else matches literally.
*/

bool IsGlob(const std::string& pattern);

bool GlobMatch(const std::string& pattern, const std::string& path);

// Literal text before the first wildcard.
std::string StaticPrefix(const std::string& pattern);

// Equal, either matches the other, or both are globs and one static prefix
// is a prefix of the other.
bool PatternsOverlap(const std::string& a, const std::string& b);

} // namespace swarm::reservation
