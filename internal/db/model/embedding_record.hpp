#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace omni::db::model {

/*
  One embedded chunk of an article.

  Identity is (article_id, chunk_index, embedding_model); id is a UUID
  assigned on first insert and kept across re-indexing of the same identity.
*/
struct EmbeddingRecord {
  std::string id;
  uint64_t    article_id  = 0;
  uint32_t    chunk_index = 0;
  std::string chunk_text;

  std::vector<float> vector;
  std::string        embedding_model;

  uint64_t created_at_ms = 0;
};

} // namespace omni::db::model
