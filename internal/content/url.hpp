#pragma once

#include <string>

namespace omni::content {

/*
  Canonical form used as the article identity:
    - surrounding whitespace trimmed
    - scheme and host lowercased, default port dropped
    - fragment and utm_* query parameters dropped
    - trailing slash removed from a non-root path

  Throws util::InvalidArgument when the text is not an absolute http(s) URL.
*/
std::string CanonicalizeUrl(const std::string& url);

} // namespace omni::content
