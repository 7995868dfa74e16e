#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace omni::content {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string FilterQuery(const std::string& query) {
  std::vector<std::string> kept;
  std::stringstream        stream(query);
  std::string              param;
  while (std::getline(stream, param, '&')) {
    if (param.empty() || Lower(param.substr(0, 4)) == "utm_") continue;
    kept.push_back(param);
  }

  std::string out;
  for (const auto& p : kept) {
    if (!out.empty()) out += '&';
    out += p;
  }
  return out;
}

} // namespace

std::string CanonicalizeUrl(const std::string& url) {
  std::string text = Trim(url);

  const auto scheme_end = text.find("://");
  if (scheme_end == std::string::npos) {
    throw util::InvalidArgument("url is not absolute: " + url);
  }
  const std::string scheme = Lower(text.substr(0, scheme_end));
  if (scheme != "http" && scheme != "https") {
    throw util::InvalidArgument("unsupported url scheme: " + url);
  }

  std::string rest = text.substr(scheme_end + 3);
  if (const auto hash = rest.find('#'); hash != std::string::npos) {
    rest.erase(hash);
  }

  const auto  path_start = rest.find_first_of("/?");
  std::string authority  = Lower(rest.substr(0, path_start));
  std::string tail       = path_start == std::string::npos ? std::string() : rest.substr(path_start);

  if ((scheme == "http" && authority.size() > 3 && authority.ends_with(":80")) ||
      (scheme == "https" && authority.size() > 4 && authority.ends_with(":443"))) {
    authority.erase(authority.rfind(':'));
  }
  if (authority.empty()) {
    throw util::InvalidArgument("url has no host: " + url);
  }

  std::string path  = tail;
  std::string query;
  if (const auto q = tail.find('?'); q != std::string::npos) {
    path  = tail.substr(0, q);
    query = FilterQuery(tail.substr(q + 1));
  }
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  if (path == "/") {
    path.clear();
  }

  std::string canonical = scheme + "://" + authority + path;
  if (!query.empty()) {
    canonical += "?" + query;
  }
  return canonical;
}

} // namespace omni::content
