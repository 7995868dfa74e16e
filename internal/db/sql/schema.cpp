#include "schema.hpp"

namespace omni::db::sql {

const std::vector<SeedSource>& DefaultNewsSources() {
  static const std::vector<SeedSource> kSources = {
      {"Yahoo Finance", "https://finance.yahoo.com", "Yahoo Finance RSS feed"},
      {"Reuters", "https://www.reuters.com", "Reuters Business news"},
  };
  return kSources;
}

const std::vector<std::string>& DefaultNewsCategories() {
  static const std::vector<std::string> kCategories = {"Business", "Markets", "Economy", "Technology", "Companies", "Commodities", "Stocks", "Cryptocurrencies"};
  return kCategories;
}

std::vector<std::string> SqliteSchemaStatements() {
  std::vector<std::string> statements = {
      "CREATE TABLE IF NOT EXISTS cryptocurrency (id INTEGER PRIMARY KEY AUTOINCREMENT, symbol TEXT NOT NULL UNIQUE, name TEXT NOT NULL, slug TEXT NOT NULL UNIQUE, "
      "first_seen_ms INTEGER NOT NULL, last_seen_ms INTEGER NOT NULL, status TEXT NOT NULL DEFAULT 'active' CHECK(status IN ('active','inactive')));",
      "CREATE TABLE IF NOT EXISTS crypto_metadata (crypto_id INTEGER PRIMARY KEY REFERENCES cryptocurrency(id) ON DELETE CASCADE, logo_url TEXT, website_url TEXT, "
      "technical_doc TEXT, description TEXT, category TEXT, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS crypto_market_data (crypto_id INTEGER NOT NULL REFERENCES cryptocurrency(id) ON DELETE CASCADE, timestamp_ms INTEGER NOT NULL, "
      "price_usd REAL NOT NULL, market_cap_usd REAL NOT NULL, volume_24h_usd REAL NOT NULL, percent_change_1h REAL, percent_change_24h REAL, percent_change_7d REAL, "
      "circulating_supply REAL, total_supply REAL, max_supply REAL, PRIMARY KEY(crypto_id, timestamp_ms));",
      "CREATE TABLE IF NOT EXISTS crypto_signals (crypto_id INTEGER NOT NULL REFERENCES cryptocurrency(id) ON DELETE CASCADE, timestamp_ms INTEGER NOT NULL, "
      "daily_return REAL, ma_7d REAL NOT NULL, std_7d REAL, rsi REAL, signal TEXT NOT NULL CHECK(signal IN ('buy','sell','hold')), PRIMARY KEY(crypto_id, timestamp_ms));",
      "CREATE TABLE IF NOT EXISTS signal_backfill_checkpoints (crypto_id INTEGER PRIMARY KEY REFERENCES cryptocurrency(id) ON DELETE CASCADE, "
      "from_timestamp_ms INTEGER NOT NULL, next_timestamp_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS news_sources (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, url TEXT, description TEXT);",
      "CREATE TABLE IF NOT EXISTS news_categories (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS news_articles (id INTEGER PRIMARY KEY AUTOINCREMENT, source_id INTEGER NOT NULL REFERENCES news_sources(id), title TEXT NOT NULL, "
      "url TEXT NOT NULL UNIQUE, published_ms INTEGER NOT NULL, fetched_ms INTEGER NOT NULL, summary TEXT, content TEXT, image_url TEXT, image_alt TEXT, "
      "sentiment_score REAL, sentiment_label TEXT, is_processed INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS idx_news_articles_published ON news_articles(published_ms DESC);",
      "CREATE TABLE IF NOT EXISTS article_categories (article_id INTEGER NOT NULL REFERENCES news_articles(id) ON DELETE CASCADE, "
      "category_id INTEGER NOT NULL REFERENCES news_categories(id) ON DELETE CASCADE, PRIMARY KEY(article_id, category_id));",
      "CREATE TABLE IF NOT EXISTS article_mentions (article_id INTEGER NOT NULL REFERENCES news_articles(id) ON DELETE CASCADE, "
      "asset_type TEXT NOT NULL CHECK(asset_type IN ('stock','crypto')), asset_symbol TEXT NOT NULL, mention_count INTEGER NOT NULL DEFAULT 1, "
      "is_primary INTEGER NOT NULL DEFAULT 0, PRIMARY KEY(article_id, asset_type, asset_symbol));",
      "CREATE INDEX IF NOT EXISTS idx_article_mentions_asset ON article_mentions(asset_type, asset_symbol);",
      "CREATE TABLE IF NOT EXISTS article_embeddings (id TEXT PRIMARY KEY, article_id INTEGER NOT NULL REFERENCES news_articles(id) ON DELETE CASCADE, "
      "chunk_index INTEGER NOT NULL, chunk_text TEXT NOT NULL, embedding_vector BLOB NOT NULL, embedding_model TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
      "UNIQUE(article_id, chunk_index, embedding_model));",
      "CREATE INDEX IF NOT EXISTS idx_article_embeddings_model ON article_embeddings(embedding_model);",
      "CREATE VIEW IF NOT EXISTS vw_recent_news AS SELECT a.id, a.title, a.url, a.published_ms, s.name AS source_name, a.summary, a.sentiment_score, "
      "a.sentiment_label FROM news_articles a JOIN news_sources s ON s.id = a.source_id ORDER BY a.published_ms DESC;",
      "CREATE VIEW IF NOT EXISTS vw_asset_news AS SELECT m.asset_type, m.asset_symbol, m.mention_count, m.is_primary, a.id AS article_id, a.title, a.url, "
      "a.published_ms, s.name AS source_name FROM article_mentions m JOIN news_articles a ON a.id = m.article_id JOIN news_sources s ON s.id = a.source_id;",
  };

  for (const auto& source : DefaultNewsSources()) {
    statements.push_back(std::string("INSERT OR IGNORE INTO news_sources(name,url,description) VALUES('") + source.name + "','" + source.url + "','" +
                         source.description + "');");
  }
  for (const auto& category : DefaultNewsCategories()) {
    statements.push_back("INSERT OR IGNORE INTO news_categories(name) VALUES('" + category + "');");
  }
  return statements;
}

std::vector<std::string> PostgresSchemaStatements() {
  std::vector<std::string> statements = {
      "CREATE TABLE IF NOT EXISTS cryptocurrency (id BIGSERIAL PRIMARY KEY, symbol TEXT NOT NULL UNIQUE, name TEXT NOT NULL, slug TEXT NOT NULL UNIQUE, "
      "first_seen_ms BIGINT NOT NULL, last_seen_ms BIGINT NOT NULL, status TEXT NOT NULL DEFAULT 'active' CHECK(status IN ('active','inactive')));",
      "CREATE TABLE IF NOT EXISTS crypto_metadata (crypto_id BIGINT PRIMARY KEY REFERENCES cryptocurrency(id) ON DELETE CASCADE, logo_url TEXT, website_url TEXT, "
      "technical_doc TEXT, description TEXT, category TEXT, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS crypto_market_data (crypto_id BIGINT NOT NULL REFERENCES cryptocurrency(id) ON DELETE CASCADE, timestamp_ms BIGINT NOT NULL, "
      "price_usd DOUBLE PRECISION NOT NULL, market_cap_usd DOUBLE PRECISION NOT NULL, volume_24h_usd DOUBLE PRECISION NOT NULL, "
      "percent_change_1h DOUBLE PRECISION, percent_change_24h DOUBLE PRECISION, percent_change_7d DOUBLE PRECISION, circulating_supply DOUBLE PRECISION, "
      "total_supply DOUBLE PRECISION, max_supply DOUBLE PRECISION, PRIMARY KEY(crypto_id, timestamp_ms));",
      "CREATE TABLE IF NOT EXISTS crypto_signals (crypto_id BIGINT NOT NULL REFERENCES cryptocurrency(id) ON DELETE CASCADE, timestamp_ms BIGINT NOT NULL, "
      "daily_return DOUBLE PRECISION, ma_7d DOUBLE PRECISION NOT NULL, std_7d DOUBLE PRECISION, rsi DOUBLE PRECISION, "
      "signal TEXT NOT NULL CHECK(signal IN ('buy','sell','hold')), PRIMARY KEY(crypto_id, timestamp_ms));",
      "CREATE TABLE IF NOT EXISTS signal_backfill_checkpoints (crypto_id BIGINT PRIMARY KEY REFERENCES cryptocurrency(id) ON DELETE CASCADE, "
      "from_timestamp_ms BIGINT NOT NULL, next_timestamp_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS news_sources (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, url TEXT, description TEXT);",
      "CREATE TABLE IF NOT EXISTS news_categories (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS news_articles (id BIGSERIAL PRIMARY KEY, source_id BIGINT NOT NULL REFERENCES news_sources(id), title TEXT NOT NULL, "
      "url TEXT NOT NULL UNIQUE, published_ms BIGINT NOT NULL, fetched_ms BIGINT NOT NULL, summary TEXT, content TEXT, image_url TEXT, image_alt TEXT, "
      "sentiment_score DOUBLE PRECISION, sentiment_label TEXT, is_processed BOOLEAN NOT NULL DEFAULT FALSE);",
      "CREATE INDEX IF NOT EXISTS idx_news_articles_published ON news_articles(published_ms DESC);",
      "CREATE TABLE IF NOT EXISTS article_categories (article_id BIGINT NOT NULL REFERENCES news_articles(id) ON DELETE CASCADE, "
      "category_id BIGINT NOT NULL REFERENCES news_categories(id) ON DELETE CASCADE, PRIMARY KEY(article_id, category_id));",
      "CREATE TABLE IF NOT EXISTS article_mentions (article_id BIGINT NOT NULL REFERENCES news_articles(id) ON DELETE CASCADE, "
      "asset_type TEXT NOT NULL CHECK(asset_type IN ('stock','crypto')), asset_symbol TEXT NOT NULL, mention_count INTEGER NOT NULL DEFAULT 1, "
      "is_primary BOOLEAN NOT NULL DEFAULT FALSE, PRIMARY KEY(article_id, asset_type, asset_symbol));",
      "CREATE INDEX IF NOT EXISTS idx_article_mentions_asset ON article_mentions(asset_type, asset_symbol);",
      "CREATE TABLE IF NOT EXISTS article_embeddings (id UUID PRIMARY KEY, article_id BIGINT NOT NULL REFERENCES news_articles(id) ON DELETE CASCADE, "
      "chunk_index INTEGER NOT NULL, chunk_text TEXT NOT NULL, embedding_vector BYTEA NOT NULL, embedding_model TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "UNIQUE(article_id, chunk_index, embedding_model));",
      "CREATE INDEX IF NOT EXISTS idx_article_embeddings_model ON article_embeddings(embedding_model);",
      "CREATE OR REPLACE VIEW vw_recent_news AS SELECT a.id, a.title, a.url, a.published_ms, s.name AS source_name, a.summary, a.sentiment_score, "
      "a.sentiment_label FROM news_articles a JOIN news_sources s ON s.id = a.source_id ORDER BY a.published_ms DESC;",
      "CREATE OR REPLACE VIEW vw_asset_news AS SELECT m.asset_type, m.asset_symbol, m.mention_count, m.is_primary, a.id AS article_id, a.title, a.url, "
      "a.published_ms, s.name AS source_name FROM article_mentions m JOIN news_articles a ON a.id = m.article_id JOIN news_sources s ON s.id = a.source_id;",
  };

  for (const auto& source : DefaultNewsSources()) {
    statements.push_back(std::string("INSERT INTO news_sources(name,url,description) VALUES('") + source.name + "','" + source.url + "','" + source.description +
                         "') ON CONFLICT (name) DO NOTHING;");
  }
  for (const auto& category : DefaultNewsCategories()) {
    statements.push_back("INSERT INTO news_categories(name) VALUES('" + category + "') ON CONFLICT (name) DO NOTHING;");
  }
  return statements;
}

} // namespace omni::db::sql
