#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/db/sql/blob_codec.hpp"

namespace omni::db::sqlite {

using omni::db::ErrorCode;
using omni::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

constexpr const char* kAssetColumns = "id,symbol,name,slug,first_seen_ms,last_seen_ms,status";
constexpr const char* kObservationColumns =
    "crypto_id,timestamp_ms,price_usd,market_cap_usd,volume_24h_usd,percent_change_1h,percent_change_24h,percent_change_7d,"
    "circulating_supply,total_supply,max_supply";
constexpr const char* kSignalColumns  = "crypto_id,timestamp_ms,daily_return,ma_7d,std_7d,rsi,signal";
constexpr const char* kArticleColumns =
    "id,source_id,title,url,published_ms,fetched_ms,summary,content,image_url,image_alt,sentiment_score,sentiment_label,is_processed";
constexpr const char* kMentionColumns   = "article_id,asset_type,asset_symbol,mention_count,is_primary";
constexpr const char* kEmbeddingColumns = "id,article_id,chunk_index,chunk_text,embedding_vector,embedding_model,created_at_ms";

// Null on failure; write paths report the error as a Result.
StmtPtr TryPrepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return StmtPtr(nullptr, &sqlite3_finalize);
  }
  return StmtPtr(st, &sqlite3_finalize);
}

StmtPtr MustPrepare(sqlite3* db, const std::string& sql) {
  auto st = TryPrepare(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Range bounds may be UINT64_MAX; INTEGER columns are signed 64-bit.
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(std::min(v, kMax)));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v.has_value()) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

std::vector<float> ColVector(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size == 0) return {};
  return sql::DecodeFloatVector(data, static_cast<std::size_t>(size));
}

model::AssetRecord ReadAsset(sqlite3_stmt* st) {
  model::AssetRecord r;
  r.id            = ColU64(st, 0);
  r.symbol        = ColText(st, 1);
  r.name          = ColText(st, 2);
  r.slug          = ColText(st, 3);
  r.first_seen_ms = ColU64(st, 4);
  r.last_seen_ms  = ColU64(st, 5);
  r.status        = model::ParseAssetStatus(ColText(st, 6)).value_or(model::AssetStatus::kActive);
  return r;
}

model::ObservationRecord ReadObservation(sqlite3_stmt* st) {
  model::ObservationRecord r;
  r.asset_id           = ColU64(st, 0);
  r.timestamp_ms       = ColU64(st, 1);
  r.price_usd          = ColDouble(st, 2);
  r.market_cap_usd     = ColDouble(st, 3);
  r.volume_24h_usd     = ColDouble(st, 4);
  r.percent_change_1h  = ColOptDouble(st, 5);
  r.percent_change_24h = ColOptDouble(st, 6);
  r.percent_change_7d  = ColOptDouble(st, 7);
  r.circulating_supply = ColOptDouble(st, 8);
  r.total_supply       = ColOptDouble(st, 9);
  r.max_supply         = ColOptDouble(st, 10);
  return r;
}

model::SignalRecord ReadSignal(sqlite3_stmt* st) {
  model::SignalRecord r;
  r.asset_id     = ColU64(st, 0);
  r.timestamp_ms = ColU64(st, 1);
  r.daily_return = ColOptDouble(st, 2);
  r.ma_7d        = ColDouble(st, 3);
  r.std_7d       = ColOptDouble(st, 4);
  r.rsi          = ColOptDouble(st, 5);
  r.signal       = model::ParseSignalKind(ColText(st, 6)).value_or(model::SignalKind::kHold);
  return r;
}

model::ArticleRecord ReadArticle(sqlite3_stmt* st) {
  model::ArticleRecord r;
  r.id              = ColU64(st, 0);
  r.source_id       = ColU64(st, 1);
  r.title           = ColText(st, 2);
  r.url             = ColText(st, 3);
  r.published_ms    = ColU64(st, 4);
  r.fetched_ms      = ColU64(st, 5);
  r.summary         = ColText(st, 6);
  r.content         = ColText(st, 7);
  r.image_url       = ColText(st, 8);
  r.image_alt       = ColText(st, 9);
  r.sentiment_score = ColOptDouble(st, 10);
  r.sentiment_label = ColText(st, 11);
  r.is_processed    = ColBool(st, 12);
  return r;
}

model::MentionRecord ReadMention(sqlite3_stmt* st) {
  model::MentionRecord r;
  r.article_id    = ColU64(st, 0);
  r.asset_type    = model::ParseAssetType(ColText(st, 1)).value_or(model::AssetType::kCrypto);
  r.asset_symbol  = ColText(st, 2);
  r.mention_count = static_cast<uint32_t>(sqlite3_column_int64(st, 3));
  r.is_primary    = ColBool(st, 4);
  return r;
}

model::EmbeddingRecord ReadEmbedding(sqlite3_stmt* st) {
  model::EmbeddingRecord r;
  r.id              = ColText(st, 0);
  r.article_id      = ColU64(st, 1);
  r.chunk_index     = static_cast<uint32_t>(sqlite3_column_int64(st, 2));
  r.chunk_text      = ColText(st, 3);
  r.vector          = ColVector(st, 4);
  r.embedding_model = ColText(st, 5);
  r.created_at_ms   = ColU64(st, 6);
  return r;
}

model::BackfillCheckpointRecord ReadCheckpoint(sqlite3_stmt* st) {
  model::BackfillCheckpointRecord r;
  r.asset_id          = ColU64(st, 0);
  r.from_timestamp_ms = ColU64(st, 1);
  r.next_timestamp_ms = ColU64(st, 2);
  r.updated_at_ms     = ColU64(st, 3);
  return r;
}

model::NewsSourceRecord ReadSource(sqlite3_stmt* st) {
  return model::NewsSourceRecord{ColU64(st, 0), ColText(st, 1), ColText(st, 2), ColText(st, 3)};
}

model::NewsCategoryRecord ReadCategory(sqlite3_stmt* st) {
  return model::NewsCategoryRecord{ColU64(st, 0), ColText(st, 1)};
}

template <typename Fn>
auto FirstRow(sqlite3* db, sqlite3_stmt* st, Fn&& read) -> std::optional<decltype(read(st))> {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return read(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

template <typename Fn>
auto CollectRows(sqlite3* db, sqlite3_stmt* st, Fn&& read) -> std::vector<decltype(read(st))> {
  std::vector<decltype(read(st))> out;
  int                             rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return out;
}

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result SqliteRepository::InsertAsset(Transaction& t, model::AssetRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, "INSERT INTO cryptocurrency(symbol,name,slug,first_seen_ms,last_seen_ms,status) VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.symbol);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.slug);
  BindU64(st.get(), 4, r.first_seen_ms);
  BindU64(st.get(), 5, r.last_seen_ms);
  BindText(st.get(), 6, std::string(model::ToString(r.status)));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, "UPDATE cryptocurrency SET symbol=?,name=?,slug=?,first_seen_ms=?,last_seen_ms=?,status=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.symbol);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.slug);
  BindU64(st.get(), 4, r.first_seen_ms);
  BindU64(st.get(), 5, r.last_seen_ms);
  BindText(st.get(), 6, std::string(model::ToString(r.status)));
  BindU64(st.get(), 7, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::AssetRecord> SqliteRepository::GetAssetById(Transaction& t, uint64_t asset_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kAssetColumns, "FROM cryptocurrency WHERE id=?;"));
  BindU64(st.get(), 1, asset_id);
  return FirstRow(db, st.get(), ReadAsset);
}

std::optional<model::AssetRecord> SqliteRepository::GetAssetBySymbol(Transaction& t, const std::string& symbol) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kAssetColumns, "FROM cryptocurrency WHERE symbol=?;"));
  BindText(st.get(), 1, symbol);
  return FirstRow(db, st.get(), ReadAsset);
}

std::vector<model::AssetRecord> SqliteRepository::ListAssets(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kAssetColumns, "FROM cryptocurrency ORDER BY id;"));
  return CollectRows(db, st.get(), ReadAsset);
}

Result SqliteRepository::DeleteAsset(Transaction& t, uint64_t asset_id) {
  auto* db = TX(t).Handle();

  // Explicit cleanup so the cascade does not depend on PRAGMA foreign_keys.
  static const char* kChildTables[] = {"DELETE FROM crypto_signals WHERE crypto_id=?;", "DELETE FROM crypto_market_data WHERE crypto_id=?;",
                                       "DELETE FROM crypto_metadata WHERE crypto_id=?;", "DELETE FROM signal_backfill_checkpoints WHERE crypto_id=?;"};
  for (const char* sql : kChildTables) {
    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, asset_id);
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  auto st = TryPrepare(db, "DELETE FROM cryptocurrency WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, asset_id);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::UpsertAssetMetadata(Transaction& t, const model::AssetMetadataRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db,
                        "INSERT INTO crypto_metadata(crypto_id,logo_url,website_url,technical_doc,description,category,updated_at_ms) VALUES(?,?,?,?,?,?,?) "
                        "ON CONFLICT(crypto_id) DO UPDATE SET logo_url=excluded.logo_url,website_url=excluded.website_url,technical_doc=excluded.technical_doc,"
                        "description=excluded.description,category=excluded.category,updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.asset_id);
  BindText(st.get(), 2, r.logo_url);
  BindText(st.get(), 3, r.website_url);
  BindText(st.get(), 4, r.technical_doc);
  BindText(st.get(), 5, r.description);
  BindText(st.get(), 6, r.category);
  BindU64(st.get(), 7, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AssetMetadataRecord> SqliteRepository::GetAssetMetadata(Transaction& t, uint64_t asset_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db,
                         "SELECT crypto_id,COALESCE(logo_url,''),COALESCE(website_url,''),COALESCE(technical_doc,''),COALESCE(description,''),"
                         "COALESCE(category,''),updated_at_ms FROM crypto_metadata WHERE crypto_id=?;");
  BindU64(st.get(), 1, asset_id);
  return FirstRow(db, st.get(), [](sqlite3_stmt* row) {
    model::AssetMetadataRecord r;
    r.asset_id      = ColU64(row, 0);
    r.logo_url      = ColText(row, 1);
    r.website_url   = ColText(row, 2);
    r.technical_doc = ColText(row, 3);
    r.description   = ColText(row, 4);
    r.category      = ColText(row, 5);
    r.updated_at_ms = ColU64(row, 6);
    return r;
  });
}

// ------------------------------------------------------------------
// Observations
// ------------------------------------------------------------------

namespace {

void BindObservationValues(sqlite3_stmt* st, const model::ObservationRecord& r, int first) {
  BindDouble(st, first, r.price_usd);
  BindDouble(st, first + 1, r.market_cap_usd);
  BindDouble(st, first + 2, r.volume_24h_usd);
  BindOptDouble(st, first + 3, r.percent_change_1h);
  BindOptDouble(st, first + 4, r.percent_change_24h);
  BindOptDouble(st, first + 5, r.percent_change_7d);
  BindOptDouble(st, first + 6, r.circulating_supply);
  BindOptDouble(st, first + 7, r.total_supply);
  BindOptDouble(st, first + 8, r.max_supply);
}

} // namespace

Result SqliteRepository::InsertObservation(Transaction& t, const model::ObservationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, std::string("INSERT INTO crypto_market_data(") + kObservationColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.asset_id);
  BindU64(st.get(), 2, r.timestamp_ms);
  BindObservationValues(st.get(), r, 3);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::ReplaceObservation(Transaction& t, const model::ObservationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db,
                        "UPDATE crypto_market_data SET price_usd=?,market_cap_usd=?,volume_24h_usd=?,percent_change_1h=?,percent_change_24h=?,"
                        "percent_change_7d=?,circulating_supply=?,total_supply=?,max_supply=? WHERE crypto_id=? AND timestamp_ms=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindObservationValues(st.get(), r, 1);
  BindU64(st.get(), 10, r.asset_id);
  BindU64(st.get(), 11, r.timestamp_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::ObservationRecord> SqliteRepository::GetObservation(Transaction& t, uint64_t asset_id, uint64_t timestamp_ms) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=? AND timestamp_ms=?;"));
  BindU64(st.get(), 1, asset_id);
  BindU64(st.get(), 2, timestamp_ms);
  return FirstRow(db, st.get(), ReadObservation);
}

std::vector<model::ObservationRecord> SqliteRepository::ListObservations(Transaction& t, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=? AND timestamp_ms>=? AND timestamp_ms<=? ORDER BY timestamp_ms;"));
  BindU64(st.get(), 1, asset_id);
  BindU64(st.get(), 2, from_ms);
  BindU64(st.get(), 3, to_ms);
  return CollectRows(db, st.get(), ReadObservation);
}

std::vector<model::ObservationRecord> SqliteRepository::ListObservationsBefore(Transaction& t, uint64_t asset_id, uint64_t before_ms, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=? AND timestamp_ms<? ORDER BY timestamp_ms DESC LIMIT ?;"));
  BindU64(st.get(), 1, asset_id);
  BindU64(st.get(), 2, before_ms);
  BindU64(st.get(), 3, limit);
  auto out = CollectRows(db, st.get(), ReadObservation);
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<model::ObservationRecord> SqliteRepository::ListObservationsFrom(Transaction& t, uint64_t asset_id, uint64_t from_ms, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kObservationColumns, "FROM crypto_market_data WHERE crypto_id=? AND timestamp_ms>=? ORDER BY timestamp_ms LIMIT ?;"));
  BindU64(st.get(), 1, asset_id);
  BindU64(st.get(), 2, from_ms);
  BindU64(st.get(), 3, limit);
  return CollectRows(db, st.get(), ReadObservation);
}

// ------------------------------------------------------------------
// Signals
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSignal(Transaction& t, const model::SignalRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, std::string("INSERT INTO crypto_signals(") + kSignalColumns +
                                ") VALUES(?,?,?,?,?,?,?) ON CONFLICT(crypto_id,timestamp_ms) DO UPDATE SET daily_return=excluded.daily_return,"
                                "ma_7d=excluded.ma_7d,std_7d=excluded.std_7d,rsi=excluded.rsi,signal=excluded.signal;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.asset_id);
  BindU64(st.get(), 2, r.timestamp_ms);
  BindOptDouble(st.get(), 3, r.daily_return);
  BindDouble(st.get(), 4, r.ma_7d);
  BindOptDouble(st.get(), 5, r.std_7d);
  BindOptDouble(st.get(), 6, r.rsi);
  BindText(st.get(), 7, std::string(model::ToString(r.signal)));
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SignalRecord> SqliteRepository::GetSignal(Transaction& t, uint64_t asset_id, uint64_t timestamp_ms) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kSignalColumns, "FROM crypto_signals WHERE crypto_id=? AND timestamp_ms=?;"));
  BindU64(st.get(), 1, asset_id);
  BindU64(st.get(), 2, timestamp_ms);
  return FirstRow(db, st.get(), ReadSignal);
}

std::optional<model::SignalRecord> SqliteRepository::LatestSignal(Transaction& t, uint64_t asset_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kSignalColumns, "FROM crypto_signals WHERE crypto_id=? ORDER BY timestamp_ms DESC LIMIT 1;"));
  BindU64(st.get(), 1, asset_id);
  return FirstRow(db, st.get(), ReadSignal);
}

std::vector<model::SignalRecord> SqliteRepository::ListSignals(Transaction& t, uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kSignalColumns, "FROM crypto_signals WHERE crypto_id=? AND timestamp_ms>=? AND timestamp_ms<=? ORDER BY timestamp_ms;"));
  BindU64(st.get(), 1, asset_id);
  BindU64(st.get(), 2, from_ms);
  BindU64(st.get(), 3, to_ms);
  return CollectRows(db, st.get(), ReadSignal);
}

// ------------------------------------------------------------------
// Backfill checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBackfillCheckpoint(Transaction& t, const model::BackfillCheckpointRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db,
                        "INSERT INTO signal_backfill_checkpoints(crypto_id,from_timestamp_ms,next_timestamp_ms,updated_at_ms) VALUES(?,?,?,?) "
                        "ON CONFLICT(crypto_id) DO UPDATE SET from_timestamp_ms=excluded.from_timestamp_ms,next_timestamp_ms=excluded.next_timestamp_ms,"
                        "updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.asset_id);
  BindU64(st.get(), 2, r.from_timestamp_ms);
  BindU64(st.get(), 3, r.next_timestamp_ms);
  BindU64(st.get(), 4, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BackfillCheckpointRecord> SqliteRepository::GetBackfillCheckpoint(Transaction& t, uint64_t asset_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT crypto_id,from_timestamp_ms,next_timestamp_ms,updated_at_ms FROM signal_backfill_checkpoints WHERE crypto_id=?;");
  BindU64(st.get(), 1, asset_id);
  return FirstRow(db, st.get(), ReadCheckpoint);
}

std::vector<model::BackfillCheckpointRecord> SqliteRepository::ListBackfillCheckpoints(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT crypto_id,from_timestamp_ms,next_timestamp_ms,updated_at_ms FROM signal_backfill_checkpoints ORDER BY crypto_id;");
  return CollectRows(db, st.get(), ReadCheckpoint);
}

Result SqliteRepository::DeleteBackfillCheckpoint(Transaction& t, uint64_t asset_id) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, "DELETE FROM signal_backfill_checkpoints WHERE crypto_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, asset_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// News reference data
// ------------------------------------------------------------------

std::optional<model::NewsSourceRecord> SqliteRepository::GetSourceByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT id,name,COALESCE(url,''),COALESCE(description,'') FROM news_sources WHERE name=?;");
  BindText(st.get(), 1, name);
  return FirstRow(db, st.get(), ReadSource);
}

std::optional<model::NewsSourceRecord> SqliteRepository::GetSourceById(Transaction& t, uint64_t source_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT id,name,COALESCE(url,''),COALESCE(description,'') FROM news_sources WHERE id=?;");
  BindU64(st.get(), 1, source_id);
  return FirstRow(db, st.get(), ReadSource);
}

std::vector<model::NewsSourceRecord> SqliteRepository::ListSources(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT id,name,COALESCE(url,''),COALESCE(description,'') FROM news_sources ORDER BY id;");
  return CollectRows(db, st.get(), ReadSource);
}

std::optional<model::NewsCategoryRecord> SqliteRepository::GetCategoryByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT id,name FROM news_categories WHERE name=?;");
  BindText(st.get(), 1, name);
  return FirstRow(db, st.get(), ReadCategory);
}

std::vector<model::NewsCategoryRecord> SqliteRepository::ListCategories(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, "SELECT id,name FROM news_categories ORDER BY id;");
  return CollectRows(db, st.get(), ReadCategory);
}

// ------------------------------------------------------------------
// Articles
// ------------------------------------------------------------------

namespace {

void BindArticleValues(sqlite3_stmt* st, const model::ArticleRecord& r) {
  BindU64(st, 1, r.source_id);
  BindText(st, 2, r.title);
  BindText(st, 3, r.url);
  BindU64(st, 4, r.published_ms);
  BindU64(st, 5, r.fetched_ms);
  BindText(st, 6, r.summary);
  BindText(st, 7, r.content);
  BindText(st, 8, r.image_url);
  BindText(st, 9, r.image_alt);
  BindOptDouble(st, 10, r.sentiment_score);
  BindText(st, 11, r.sentiment_label);
  BindBool(st, 12, r.is_processed);
}

} // namespace

Result SqliteRepository::InsertArticle(Transaction& t, model::ArticleRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db,
                        "INSERT INTO news_articles(source_id,title,url,published_ms,fetched_ms,summary,content,image_url,image_alt,sentiment_score,"
                        "sentiment_label,is_processed) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindArticleValues(st.get(), r);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::UpdateArticle(Transaction& t, const model::ArticleRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db,
                        "UPDATE news_articles SET source_id=?,title=?,url=?,published_ms=?,fetched_ms=?,summary=?,content=?,image_url=?,image_alt=?,"
                        "sentiment_score=?,sentiment_label=?,is_processed=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindArticleValues(st.get(), r);
  BindU64(st.get(), 13, r.id);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::optional<model::ArticleRecord> SqliteRepository::GetArticleById(Transaction& t, uint64_t article_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kArticleColumns, "FROM news_articles WHERE id=?;"));
  BindU64(st.get(), 1, article_id);
  return FirstRow(db, st.get(), ReadArticle);
}

std::optional<model::ArticleRecord> SqliteRepository::GetArticleByUrl(Transaction& t, const std::string& url) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kArticleColumns, "FROM news_articles WHERE url=?;"));
  BindText(st.get(), 1, url);
  return FirstRow(db, st.get(), ReadArticle);
}

std::vector<model::ArticleRecord> SqliteRepository::ListRecentArticles(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kArticleColumns, "FROM news_articles ORDER BY published_ms DESC, id DESC LIMIT ?;"));
  BindU64(st.get(), 1, limit);
  return CollectRows(db, st.get(), ReadArticle);
}

std::vector<model::ArticleRecord> SqliteRepository::ListUnprocessedArticles(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kArticleColumns, "FROM news_articles WHERE is_processed=0 ORDER BY id LIMIT ?;"));
  BindU64(st.get(), 1, limit);
  return CollectRows(db, st.get(), ReadArticle);
}

Result SqliteRepository::DeleteArticle(Transaction& t, uint64_t article_id) {
  auto* db = TX(t).Handle();

  static const char* kChildTables[] = {"DELETE FROM article_embeddings WHERE article_id=?;", "DELETE FROM article_mentions WHERE article_id=?;",
                                       "DELETE FROM article_categories WHERE article_id=?;"};
  for (const char* sql : kChildTables) {
    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, article_id);
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  auto st = TryPrepare(db, "DELETE FROM news_articles WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, article_id);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::AddArticleCategory(Transaction& t, uint64_t article_id, uint64_t category_id) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, "INSERT INTO article_categories(article_id,category_id) VALUES(?,?) ON CONFLICT(article_id,category_id) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, article_id);
  BindU64(st.get(), 2, category_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::NewsCategoryRecord> SqliteRepository::GetArticleCategories(Transaction& t, uint64_t article_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db,
                         "SELECT c.id,c.name FROM article_categories ac JOIN news_categories c ON c.id = ac.category_id WHERE ac.article_id=? "
                         "ORDER BY c.id;");
  BindU64(st.get(), 1, article_id);
  return CollectRows(db, st.get(), ReadCategory);
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMention(Transaction& t, const model::MentionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, std::string("INSERT INTO article_mentions(") + kMentionColumns +
                                ") VALUES(?,?,?,?,?) ON CONFLICT(article_id,asset_type,asset_symbol) DO UPDATE SET "
                                "mention_count=article_mentions.mention_count+excluded.mention_count,"
                                "is_primary=MAX(article_mentions.is_primary,excluded.is_primary);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.article_id);
  BindText(st.get(), 2, std::string(model::ToString(r.asset_type)));
  BindText(st.get(), 3, r.asset_symbol);
  BindU64(st.get(), 4, r.mention_count);
  BindBool(st.get(), 5, r.is_primary);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MentionRecord> SqliteRepository::GetMention(Transaction& t, uint64_t article_id, model::AssetType type, const std::string& symbol) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kMentionColumns, "FROM article_mentions WHERE article_id=? AND asset_type=? AND asset_symbol=?;"));
  BindU64(st.get(), 1, article_id);
  BindText(st.get(), 2, std::string(model::ToString(type)));
  BindText(st.get(), 3, symbol);
  return FirstRow(db, st.get(), ReadMention);
}

std::vector<model::MentionRecord> SqliteRepository::ListMentionsForArticle(Transaction& t, uint64_t article_id) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kMentionColumns, "FROM article_mentions WHERE article_id=? ORDER BY asset_type, asset_symbol;"));
  BindU64(st.get(), 1, article_id);
  return CollectRows(db, st.get(), ReadMention);
}

std::vector<model::MentionRecord> SqliteRepository::ListMentionsForAsset(Transaction& t, model::AssetType type, const std::string& symbol) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kMentionColumns, "FROM article_mentions WHERE asset_type=? AND asset_symbol=? ORDER BY article_id;"));
  BindText(st.get(), 1, std::string(model::ToString(type)));
  BindText(st.get(), 2, symbol);
  return CollectRows(db, st.get(), ReadMention);
}

// ------------------------------------------------------------------
// Embeddings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEmbedding(Transaction& t, const model::EmbeddingRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, std::string("INSERT INTO article_embeddings(") + kEmbeddingColumns +
                                ") VALUES(?,?,?,?,?,?,?) ON CONFLICT(article_id,chunk_index,embedding_model) DO UPDATE SET "
                                "chunk_text=excluded.chunk_text,embedding_vector=excluded.embedding_vector;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.article_id);
  BindU64(st.get(), 3, r.chunk_index);
  BindText(st.get(), 4, r.chunk_text);
  BindBlob(st.get(), 5, sql::EncodeFloatVector(r.vector));
  BindText(st.get(), 6, r.embedding_model);
  BindU64(st.get(), 7, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EmbeddingRecord> SqliteRepository::GetEmbedding(Transaction& t, uint64_t article_id, uint32_t chunk_index, const std::string& model) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kEmbeddingColumns, "FROM article_embeddings WHERE article_id=? AND chunk_index=? AND embedding_model=?;"));
  BindU64(st.get(), 1, article_id);
  BindU64(st.get(), 2, chunk_index);
  BindText(st.get(), 3, model);
  return FirstRow(db, st.get(), ReadEmbedding);
}

Result SqliteRepository::DeleteEmbeddings(Transaction& t, uint64_t article_id, const std::string& model) {
  auto* db = TX(t).Handle();
  auto  st = TryPrepare(db, model.empty() ? "DELETE FROM article_embeddings WHERE article_id=?;"
                                           : "DELETE FROM article_embeddings WHERE article_id=? AND embedding_model=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, article_id);
  if (!model.empty()) BindText(st.get(), 2, model);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::EmbeddingRecord> SqliteRepository::ListEmbeddingsForArticle(Transaction& t, uint64_t article_id, const std::string& model) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kEmbeddingColumns, "FROM article_embeddings WHERE article_id=? AND embedding_model=? ORDER BY chunk_index;"));
  BindU64(st.get(), 1, article_id);
  BindText(st.get(), 2, model);
  return CollectRows(db, st.get(), ReadEmbedding);
}

std::vector<model::EmbeddingRecord> SqliteRepository::ListEmbeddingsByModel(Transaction& t, const std::string& model) {
  auto* db = TX(t).Handle();
  auto  st = MustPrepare(db, Select(kEmbeddingColumns, "FROM article_embeddings WHERE embedding_model=? ORDER BY article_id, chunk_index;"));
  BindText(st.get(), 1, model);
  return CollectRows(db, st.get(), ReadEmbedding);
}

} // namespace omni::db::sqlite
