#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace omni::db::model {

/*
  Scraped news article. url is canonical and unique.

  is_processed is set once the current content has a committed chunk set
  and is never reset by re-delivery of the same url.
*/
struct ArticleRecord {
  uint64_t    id        = 0;
  uint64_t    source_id = 0;
  std::string title;
  std::string url;

  uint64_t published_ms = 0;
  uint64_t fetched_ms   = 0;

  std::string summary;
  std::string content;
  std::string image_url;
  std::string image_alt;

  std::optional<double> sentiment_score;
  std::string           sentiment_label;

  bool is_processed = false;
};

} // namespace omni::db::model
