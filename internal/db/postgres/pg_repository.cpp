#include "pg_repository.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>

#include "internal/db/sql/blob_codec.hpp"

namespace omni::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

// Range bounds may be UINT64_MAX; BIGINT is signed.
int64_t I64(uint64_t v) {
  constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  return static_cast<int64_t>(std::min(v, kMax));
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

std::optional<double> OptDouble(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<double>();
}

Bytes ToBytes(const std::vector<float>& values) {
  const std::string packed = sql::EncodeFloatVector(values);
  Bytes             out(packed.size(), std::byte{0});
  std::memcpy(out.data(), packed.data(), packed.size());
  return out;
}

std::vector<float> FromBytes(const pqxx::field& f) {
  if (f.is_null()) return {};
  const auto bytes = f.as<Bytes>();
  return sql::DecodeFloatVector(bytes.data(), bytes.size());
}

std::string EnumText(std::string_view v) {
  return std::string(v);
}

constexpr const char* kAssetColumns = "id,symbol,name,slug,first_seen_ms,last_seen_ms,status";
constexpr const char* kObservationColumns =
    "crypto_id,timestamp_ms,price_usd,market_cap_usd,volume_24h_usd,percent_change_1h,percent_change_24h,percent_change_7d,"
    "circulating_supply,total_supply,max_supply";
constexpr const char* kSignalColumns  = "crypto_id,timestamp_ms,daily_return,ma_7d,std_7d,rsi,signal";
constexpr const char* kArticleColumns =
    "id,source_id,title,url,published_ms,fetched_ms,summary,content,image_url,image_alt,sentiment_score,sentiment_label,is_processed";
constexpr const char* kMentionColumns   = "article_id,asset_type,asset_symbol,mention_count,is_primary";
constexpr const char* kEmbeddingColumns = "id::text,article_id,chunk_index,chunk_text,embedding_vector,embedding_model,created_at_ms";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

model::AssetRecord ReadAsset(const pqxx::row& row) {
  model::AssetRecord r;
  r.id            = row[0].as<uint64_t>();
  r.symbol        = Text(row[1]);
  r.name          = Text(row[2]);
  r.slug          = Text(row[3]);
  r.first_seen_ms = row[4].as<uint64_t>();
  r.last_seen_ms  = row[5].as<uint64_t>();
  r.status        = model::ParseAssetStatus(Text(row[6])).value_or(model::AssetStatus::kActive);
  return r;
}

model::ObservationRecord ReadObservation(const pqxx::row& row) {
  model::ObservationRecord r;
  r.asset_id           = row[0].as<uint64_t>();
  r.timestamp_ms       = row[1].as<uint64_t>();
  r.price_usd          = row[2].as<double>();
  r.market_cap_usd     = row[3].as<double>();
  r.volume_24h_usd     = row[4].as<double>();
  r.percent_change_1h  = OptDouble(row[5]);
  r.percent_change_24h = OptDouble(row[6]);
  r.percent_change_7d  = OptDouble(row[7]);
  r.circulating_supply = OptDouble(row[8]);
  r.total_supply       = OptDouble(row[9]);
  r.max_supply         = OptDouble(row[10]);
  return r;
}

model::SignalRecord ReadSignal(const pqxx::row& row) {
  model::SignalRecord r;
  r.asset_id     = row[0].as<uint64_t>();
  r.timestamp_ms = row[1].as<uint64_t>();
  r.daily_return = OptDouble(row[2]);
  r.ma_7d        = row[3].as<double>();
  r.std_7d       = OptDouble(row[4]);
  r.rsi          = OptDouble(row[5]);
  r.signal       = model::ParseSignalKind(Text(row[6])).value_or(model::SignalKind::kHold);
  return r;
}

model::ArticleRecord ReadArticle(const pqxx::row& row) {
  model::ArticleRecord r;
  r.id              = row[0].as<uint64_t>();
  r.source_id       = row[1].as<uint64_t>();
  r.title           = Text(row[2]);
  r.url             = Text(row[3]);
  r.published_ms    = row[4].as<uint64_t>();
  r.fetched_ms      = row[5].as<uint64_t>();
  r.summary         = Text(row[6]);
  r.content         = Text(row[7]);
  r.image_url       = Text(row[8]);
  r.image_alt       = Text(row[9]);
  r.sentiment_score = OptDouble(row[10]);
  r.sentiment_label = Text(row[11]);
  r.is_processed    = row[12].as<bool>();
  return r;
}

model::MentionRecord ReadMention(const pqxx::row& row) {
  model::MentionRecord r;
  r.article_id    = row[0].as<uint64_t>();
  r.asset_type    = model::ParseAssetType(Text(row[1])).value_or(model::AssetType::kCrypto);
  r.asset_symbol  = Text(row[2]);
  r.mention_count = row[3].as<uint32_t>();
  r.is_primary    = row[4].as<bool>();
  return r;
}

model::EmbeddingRecord ReadEmbedding(const pqxx::row& row) {
  model::EmbeddingRecord r;
  r.id              = Text(row[0]);
  r.article_id      = row[1].as<uint64_t>();
  r.chunk_index     = row[2].as<uint32_t>();
  r.chunk_text      = Text(row[3]);
  r.vector          = FromBytes(row[4]);
  r.embedding_model = Text(row[5]);
  r.created_at_ms   = row[6].as<uint64_t>();
  return r;
}

model::BackfillCheckpointRecord ReadCheckpoint(const pqxx::row& row) {
  model::BackfillCheckpointRecord r;
  r.asset_id          = row[0].as<uint64_t>();
  r.from_timestamp_ms = row[1].as<uint64_t>();
  r.next_timestamp_ms = row[2].as<uint64_t>();
  r.updated_at_ms     = row[3].as<uint64_t>();
  return r;
}

model::NewsSourceRecord ReadSource(const pqxx::row& row) {
  return model::NewsSourceRecord{row[0].as<uint64_t>(), Text(row[1]), Text(row[2]), Text(row[3])};
}

model::NewsCategoryRecord ReadCategory(const pqxx::row& row) {
  return model::NewsCategoryRecord{row[0].as<uint64_t>(), Text(row[1])};
}

template <typename Fn>
auto First(const pqxx::result& res, Fn&& read) -> std::optional<decltype(read(res[0]))> {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

template <typename Fn>
auto All(const pqxx::result& res, Fn&& read) -> std::vector<decltype(read(res[0]))> {
  std::vector<decltype(read(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result PgRepository::InsertAsset(Transaction& t, model::AssetRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO cryptocurrency(symbol,name,slug,first_seen_ms,last_seen_ms,status) VALUES($1,$2,$3,$4,$5,$6) RETURNING id;", r.symbol, r.name,
        r.slug, I64(r.first_seen_ms), I64(r.last_seen_ms), EnumText(model::ToString(r.status)));
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE cryptocurrency SET symbol=$2,name=$3,slug=$4,first_seen_ms=$5,last_seen_ms=$6,status=$7 WHERE id=$1;",
                                        I64(r.id), r.symbol, r.name, r.slug, I64(r.first_seen_ms), I64(r.last_seen_ms),
                                        EnumText(model::ToString(r.status)));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AssetRecord> PgRepository::GetAssetById(Transaction& t, uint64_t asset_id) {
  return First(TX(t).Work().exec_params(Select(kAssetColumns, "FROM cryptocurrency WHERE id=$1;"), I64(asset_id)), ReadAsset);
}

std::optional<model::AssetRecord> PgRepository::GetAssetBySymbol(Transaction& t, const std::string& symbol) {
  return First(TX(t).Work().exec_prepared("omni_get_asset_by_symbol", symbol), ReadAsset);
}

std::vector<model::AssetRecord> PgRepository::ListAssets(Transaction& t) {
  return All(TX(t).Work().exec(Select(kAssetColumns, "FROM cryptocurrency ORDER BY id;")), ReadAsset);
}

Result PgRepository::DeleteAsset(Transaction& t, uint64_t asset_id) {
  try {
    // Children go through ON DELETE CASCADE.
    auto res = TX(t).Work().exec_params("DELETE FROM cryptocurrency WHERE id=$1;", I64(asset_id));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertAssetMetadata(Transaction& t, const model::AssetMetadataRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO crypto_metadata(crypto_id,logo_url,website_url,technical_doc,description,category,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(crypto_id) DO UPDATE SET logo_url=EXCLUDED.logo_url,website_url=EXCLUDED.website_url,technical_doc=EXCLUDED.technical_doc,"
        "description=EXCLUDED.description,category=EXCLUDED.category,updated_at_ms=EXCLUDED.updated_at_ms;",
        I64(r.asset_id), r.logo_url, r.website_url, r.technical_doc, r.description, r.category, I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AssetMetadataRecord> PgRepository::GetAssetMetadata(Transaction& t, uint64_t asset_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT crypto_id,logo_url,website_url,technical_doc,description,category,updated_at_ms FROM crypto_metadata WHERE crypto_id=$1;", I64(asset_id));
  return First(res, [](const pqxx::row& row) {
    model::AssetMetadataRecord r;
    r.asset_id      = row[0].as<uint64_t>();
    r.logo_url      = Text(row[1]);
    r.website_url   = Text(row[2]);
    r.technical_doc = Text(row[3]);
    r.description   = Text(row[4]);
    r.category      = Text(row[5]);
    r.updated_at_ms = row[6].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Observations
// ------------------------------------------------------------------

Result PgRepository::InsertObservation(Transaction& t, const model::ObservationRecord& r) {
  try {
    TX(t).Work().exec_prepared("omni_insert_observation", I64(r.asset_id), I64(r.timestamp_ms), r.price_usd, r.market_cap_usd, r.volume_24h_usd,
                               r.percent_change_1h, r.percent_change_24h, r.percent_change_7d, r.circulating_supply, r.total_supply, r.max_supply);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReplaceObservation(Transaction& t, const model::ObservationRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE crypto_market_data SET price_usd=$3,market_cap_usd=$4,volume_24h_usd=$5,percent_change_1h=$6,percent_change_24h=$7,"
        "percent_change_7d=$8,circulating_supply=$9,total_supply=$10,max_supply=$11 WHERE crypto_id=$1 AND timestamp_ms=$2;",
        I64(r.asset_id), I64(r.timestamp_ms), r.price_usd, r.market_cap_usd, r.volume_24h_usd, r.percent_change_1h, r.percent_change_24h,
        r.percent_change_7d, r.circulating_supply, r.total_supply, r.max_supply);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ObservationRecord> PgRepository::GetObservation(Transaction& t, uint64_t asset_id, uint64_t timestamp_ms) {
  return First(TX(t).Work().exec_params(Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=$1 AND timestamp_ms=$2;"), I64(asset_id),
                                        I64(timestamp_ms)),
               ReadObservation);
}

std::vector<model::ObservationRecord> PgRepository::ListObservations(Transaction& t, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  return All(TX(t).Work().exec_params(
                 Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=$1 AND timestamp_ms>=$2 AND timestamp_ms<=$3 ORDER BY timestamp_ms;"),
                 I64(asset_id), I64(from_ms), I64(to_ms)),
             ReadObservation);
}

std::vector<model::ObservationRecord> PgRepository::ListObservationsBefore(Transaction& t, uint64_t asset_id, uint64_t before_ms, std::size_t limit) {
  auto out = All(TX(t).Work().exec_params(
                     Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=$1 AND timestamp_ms<$2 ORDER BY timestamp_ms DESC LIMIT $3;"),
                     I64(asset_id), I64(before_ms), I64(limit)),
                 ReadObservation);
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<model::ObservationRecord> PgRepository::ListObservationsFrom(Transaction& t, uint64_t asset_id, uint64_t from_ms, std::size_t limit) {
  return All(TX(t).Work().exec_params(
                 Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=$1 AND timestamp_ms>=$2 ORDER BY timestamp_ms LIMIT $3;"),
                 I64(asset_id), I64(from_ms), I64(limit)),
             ReadObservation);
}

// ------------------------------------------------------------------
// Signals
// ------------------------------------------------------------------

Result PgRepository::UpsertSignal(Transaction& t, const model::SignalRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO crypto_signals(") + kSignalColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT(crypto_id,timestamp_ms) DO UPDATE SET daily_return=EXCLUDED.daily_return,"
                                 "ma_7d=EXCLUDED.ma_7d,std_7d=EXCLUDED.std_7d,rsi=EXCLUDED.rsi,signal=EXCLUDED.signal;",
                             I64(r.asset_id), I64(r.timestamp_ms), r.daily_return, r.ma_7d, r.std_7d, r.rsi, EnumText(model::ToString(r.signal)));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SignalRecord> PgRepository::GetSignal(Transaction& t, uint64_t asset_id, uint64_t timestamp_ms) {
  return First(
      TX(t).Work().exec_params(Select(kSignalColumns, "FROM crypto_signals WHERE crypto_id=$1 AND timestamp_ms=$2;"), I64(asset_id), I64(timestamp_ms)),
      ReadSignal);
}

std::optional<model::SignalRecord> PgRepository::LatestSignal(Transaction& t, uint64_t asset_id) {
  return First(TX(t).Work().exec_prepared("omni_latest_signal", I64(asset_id)), ReadSignal);
}

std::vector<model::SignalRecord> PgRepository::ListSignals(Transaction& t, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  return All(TX(t).Work().exec_params(
                 Select(kSignalColumns, "FROM crypto_signals WHERE crypto_id=$1 AND timestamp_ms>=$2 AND timestamp_ms<=$3 ORDER BY timestamp_ms;"),
                 I64(asset_id), I64(from_ms), I64(to_ms)),
             ReadSignal);
}

// ------------------------------------------------------------------
// Backfill checkpoints
// ------------------------------------------------------------------

Result PgRepository::UpsertBackfillCheckpoint(Transaction& t, const model::BackfillCheckpointRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO signal_backfill_checkpoints(crypto_id,from_timestamp_ms,next_timestamp_ms,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(crypto_id) DO UPDATE SET from_timestamp_ms=EXCLUDED.from_timestamp_ms,next_timestamp_ms=EXCLUDED.next_timestamp_ms,"
        "updated_at_ms=EXCLUDED.updated_at_ms;",
        I64(r.asset_id), I64(r.from_timestamp_ms), I64(r.next_timestamp_ms), I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BackfillCheckpointRecord> PgRepository::GetBackfillCheckpoint(Transaction& t, uint64_t asset_id) {
  return First(TX(t).Work().exec_params(
                   "SELECT crypto_id,from_timestamp_ms,next_timestamp_ms,updated_at_ms FROM signal_backfill_checkpoints WHERE crypto_id=$1;", I64(asset_id)),
               ReadCheckpoint);
}

std::vector<model::BackfillCheckpointRecord> PgRepository::ListBackfillCheckpoints(Transaction& t) {
  return All(TX(t).Work().exec("SELECT crypto_id,from_timestamp_ms,next_timestamp_ms,updated_at_ms FROM signal_backfill_checkpoints ORDER BY crypto_id;"),
             ReadCheckpoint);
}

Result PgRepository::DeleteBackfillCheckpoint(Transaction& t, uint64_t asset_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM signal_backfill_checkpoints WHERE crypto_id=$1;", I64(asset_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// News reference data
// ------------------------------------------------------------------

std::optional<model::NewsSourceRecord> PgRepository::GetSourceByName(Transaction& t, const std::string& name) {
  return First(TX(t).Work().exec_params("SELECT id,name,url,description FROM news_sources WHERE name=$1;", name), ReadSource);
}

std::optional<model::NewsSourceRecord> PgRepository::GetSourceById(Transaction& t, uint64_t source_id) {
  return First(TX(t).Work().exec_params("SELECT id,name,url,description FROM news_sources WHERE id=$1;", I64(source_id)), ReadSource);
}

std::vector<model::NewsSourceRecord> PgRepository::ListSources(Transaction& t) {
  return All(TX(t).Work().exec("SELECT id,name,url,description FROM news_sources ORDER BY id;"), ReadSource);
}

std::optional<model::NewsCategoryRecord> PgRepository::GetCategoryByName(Transaction& t, const std::string& name) {
  return First(TX(t).Work().exec_params("SELECT id,name FROM news_categories WHERE name=$1;", name), ReadCategory);
}

std::vector<model::NewsCategoryRecord> PgRepository::ListCategories(Transaction& t) {
  return All(TX(t).Work().exec("SELECT id,name FROM news_categories ORDER BY id;"), ReadCategory);
}

// ------------------------------------------------------------------
// Articles
// ------------------------------------------------------------------

Result PgRepository::InsertArticle(Transaction& t, model::ArticleRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO news_articles(source_id,title,url,published_ms,fetched_ms,summary,content,image_url,image_alt,sentiment_score,sentiment_label,"
        "is_processed) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) RETURNING id;",
        I64(r.source_id), r.title, r.url, I64(r.published_ms), I64(r.fetched_ms), r.summary, r.content, r.image_url, r.image_alt, r.sentiment_score,
        r.sentiment_label, r.is_processed);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateArticle(Transaction& t, const model::ArticleRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE news_articles SET source_id=$2,title=$3,url=$4,published_ms=$5,fetched_ms=$6,summary=$7,content=$8,image_url=$9,image_alt=$10,"
        "sentiment_score=$11,sentiment_label=$12,is_processed=$13 WHERE id=$1;",
        I64(r.id), I64(r.source_id), r.title, r.url, I64(r.published_ms), I64(r.fetched_ms), r.summary, r.content, r.image_url, r.image_alt,
        r.sentiment_score, r.sentiment_label, r.is_processed);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ArticleRecord> PgRepository::GetArticleById(Transaction& t, uint64_t article_id) {
  return First(TX(t).Work().exec_params(Select(kArticleColumns, "FROM news_articles WHERE id=$1;"), I64(article_id)), ReadArticle);
}

std::optional<model::ArticleRecord> PgRepository::GetArticleByUrl(Transaction& t, const std::string& url) {
  return First(TX(t).Work().exec_params(Select(kArticleColumns, "FROM news_articles WHERE url=$1;"), url), ReadArticle);
}

std::vector<model::ArticleRecord> PgRepository::ListRecentArticles(Transaction& t, std::size_t limit) {
  return All(TX(t).Work().exec_params(Select(kArticleColumns, "FROM news_articles ORDER BY published_ms DESC, id DESC LIMIT $1;"), I64(limit)),
             ReadArticle);
}

std::vector<model::ArticleRecord> PgRepository::ListUnprocessedArticles(Transaction& t, std::size_t limit) {
  return All(TX(t).Work().exec_params(Select(kArticleColumns, "FROM news_articles WHERE is_processed=FALSE ORDER BY id LIMIT $1;"), I64(limit)),
             ReadArticle);
}

Result PgRepository::DeleteArticle(Transaction& t, uint64_t article_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM news_articles WHERE id=$1;", I64(article_id));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AddArticleCategory(Transaction& t, uint64_t article_id, uint64_t category_id) {
  try {
    TX(t).Work().exec_params("INSERT INTO article_categories(article_id,category_id) VALUES($1,$2) ON CONFLICT DO NOTHING;", I64(article_id),
                             I64(category_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::NewsCategoryRecord> PgRepository::GetArticleCategories(Transaction& t, uint64_t article_id) {
  return All(TX(t).Work().exec_params("SELECT c.id,c.name FROM article_categories ac JOIN news_categories c ON c.id = ac.category_id "
                                      "WHERE ac.article_id=$1 ORDER BY c.id;",
                                      I64(article_id)),
             ReadCategory);
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result PgRepository::UpsertMention(Transaction& t, const model::MentionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO article_mentions(") + kMentionColumns +
                                 ") VALUES($1,$2,$3,$4,$5) ON CONFLICT(article_id,asset_type,asset_symbol) DO UPDATE SET "
                                 "mention_count=article_mentions.mention_count+EXCLUDED.mention_count,"
                                 "is_primary=article_mentions.is_primary OR EXCLUDED.is_primary;",
                             I64(r.article_id), EnumText(model::ToString(r.asset_type)), r.asset_symbol, static_cast<int64_t>(r.mention_count),
                             r.is_primary);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MentionRecord> PgRepository::GetMention(Transaction& t, uint64_t article_id, model::AssetType type, const std::string& symbol) {
  return First(TX(t).Work().exec_params(Select(kMentionColumns, "FROM article_mentions WHERE article_id=$1 AND asset_type=$2 AND asset_symbol=$3;"),
                                        I64(article_id), EnumText(model::ToString(type)), symbol),
               ReadMention);
}

std::vector<model::MentionRecord> PgRepository::ListMentionsForArticle(Transaction& t, uint64_t article_id) {
  return All(TX(t).Work().exec_params(Select(kMentionColumns, "FROM article_mentions WHERE article_id=$1 ORDER BY asset_type, asset_symbol;"),
                                      I64(article_id)),
             ReadMention);
}

std::vector<model::MentionRecord> PgRepository::ListMentionsForAsset(Transaction& t, model::AssetType type, const std::string& symbol) {
  return All(TX(t).Work().exec_params(Select(kMentionColumns, "FROM article_mentions WHERE asset_type=$1 AND asset_symbol=$2 ORDER BY article_id;"),
                                      EnumText(model::ToString(type)), symbol),
             ReadMention);
}

// ------------------------------------------------------------------
// Embeddings
// ------------------------------------------------------------------

Result PgRepository::UpsertEmbedding(Transaction& t, const model::EmbeddingRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO article_embeddings(id,article_id,chunk_index,chunk_text,embedding_vector,embedding_model,created_at_ms) "
        "VALUES($1::uuid,$2,$3,$4,$5,$6,$7) ON CONFLICT(article_id,chunk_index,embedding_model) DO UPDATE SET "
        "chunk_text=EXCLUDED.chunk_text,embedding_vector=EXCLUDED.embedding_vector;",
        r.id, I64(r.article_id), static_cast<int64_t>(r.chunk_index), r.chunk_text, ToBytes(r.vector), r.embedding_model, I64(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EmbeddingRecord> PgRepository::GetEmbedding(Transaction& t, uint64_t article_id, uint32_t chunk_index, const std::string& model) {
  return First(TX(t).Work().exec_params(
                   Select(kEmbeddingColumns, "FROM article_embeddings WHERE article_id=$1 AND chunk_index=$2 AND embedding_model=$3;"), I64(article_id),
                   static_cast<int64_t>(chunk_index), model),
               ReadEmbedding);
}

Result PgRepository::DeleteEmbeddings(Transaction& t, uint64_t article_id, const std::string& model) {
  try {
    if (model.empty()) {
      TX(t).Work().exec_params("DELETE FROM article_embeddings WHERE article_id=$1;", I64(article_id));
    } else {
      TX(t).Work().exec_params("DELETE FROM article_embeddings WHERE article_id=$1 AND embedding_model=$2;", I64(article_id), model);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EmbeddingRecord> PgRepository::ListEmbeddingsForArticle(Transaction& t, uint64_t article_id, const std::string& model) {
  return All(TX(t).Work().exec_params(
                 Select(kEmbeddingColumns, "FROM article_embeddings WHERE article_id=$1 AND embedding_model=$2 ORDER BY chunk_index;"), I64(article_id),
                 model),
             ReadEmbedding);
}

std::vector<model::EmbeddingRecord> PgRepository::ListEmbeddingsByModel(Transaction& t, const std::string& model) {
  return All(TX(t).Work().exec_params(Select(kEmbeddingColumns, "FROM article_embeddings WHERE embedding_model=$1 ORDER BY article_id, chunk_index;"),
                                      model),
             ReadEmbedding);
}

} // namespace omni::db::postgres
