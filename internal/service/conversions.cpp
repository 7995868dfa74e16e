#include "conversions.hpp"

#include "internal/util/errors.hpp"

namespace omni::service {

db::model::ObservationRecord FromProto(const omni::v1::Observation& observation) {
  db::model::ObservationRecord record;
  record.timestamp_ms   = observation.timestamp_ms();
  record.price_usd      = observation.price_usd();
  record.market_cap_usd = observation.market_cap_usd();
  record.volume_24h_usd = observation.volume_24h_usd();
  if (observation.has_percent_change_1h()) record.percent_change_1h = observation.percent_change_1h();
  if (observation.has_percent_change_24h()) record.percent_change_24h = observation.percent_change_24h();
  if (observation.has_percent_change_7d()) record.percent_change_7d = observation.percent_change_7d();
  if (observation.has_circulating_supply()) record.circulating_supply = observation.circulating_supply();
  if (observation.has_total_supply()) record.total_supply = observation.total_supply();
  if (observation.has_max_supply()) record.max_supply = observation.max_supply();
  return record;
}

omni::v1::Observation ToProto(const db::model::ObservationRecord& observation, const std::string& symbol) {
  omni::v1::Observation out;
  out.set_symbol(symbol);
  out.set_timestamp_ms(observation.timestamp_ms);
  out.set_price_usd(observation.price_usd);
  out.set_market_cap_usd(observation.market_cap_usd);
  out.set_volume_24h_usd(observation.volume_24h_usd);
  if (observation.percent_change_1h) out.set_percent_change_1h(*observation.percent_change_1h);
  if (observation.percent_change_24h) out.set_percent_change_24h(*observation.percent_change_24h);
  if (observation.percent_change_7d) out.set_percent_change_7d(*observation.percent_change_7d);
  if (observation.circulating_supply) out.set_circulating_supply(*observation.circulating_supply);
  if (observation.total_supply) out.set_total_supply(*observation.total_supply);
  if (observation.max_supply) out.set_max_supply(*observation.max_supply);
  return out;
}

omni::v1::SignalKind ToProto(db::model::SignalKind kind) {
  switch (kind) {
    case db::model::SignalKind::kBuy:
      return omni::v1::SIGNAL_KIND_BUY;
    case db::model::SignalKind::kSell:
      return omni::v1::SIGNAL_KIND_SELL;
    case db::model::SignalKind::kHold:
      return omni::v1::SIGNAL_KIND_HOLD;
  }
  return omni::v1::SIGNAL_KIND_UNSPECIFIED;
}

omni::v1::AssetType ToProto(db::model::AssetType type) {
  return type == db::model::AssetType::kStock ? omni::v1::ASSET_TYPE_STOCK : omni::v1::ASSET_TYPE_CRYPTO;
}

db::model::AssetType FromProto(omni::v1::AssetType type) {
  switch (type) {
    case omni::v1::ASSET_TYPE_STOCK:
      return db::model::AssetType::kStock;
    case omni::v1::ASSET_TYPE_CRYPTO:
      return db::model::AssetType::kCrypto;
    default:
      throw util::InvalidArgument("asset_type is required");
  }
}

omni::v1::Signal ToProto(const db::model::SignalRecord& signal, const std::string& symbol) {
  omni::v1::Signal out;
  out.set_symbol(symbol);
  out.set_timestamp_ms(signal.timestamp_ms);
  if (signal.daily_return) out.set_daily_return(*signal.daily_return);
  out.set_ma_7d(signal.ma_7d);
  if (signal.std_7d) out.set_std_7d(*signal.std_7d);
  if (signal.rsi) out.set_rsi(*signal.rsi);
  out.set_signal(ToProto(signal.signal));
  return out;
}

omni::v1::Mention ToProto(const db::model::MentionRecord& mention) {
  omni::v1::Mention out;
  out.set_article_id(mention.article_id);
  out.set_asset_type(ToProto(mention.asset_type));
  out.set_asset_symbol(mention.asset_symbol);
  out.set_mention_count(mention.mention_count);
  out.set_is_primary(mention.is_primary);
  return out;
}

omni::v1::Article ToProto(const db::model::ArticleRecord& article, const std::string& source_name, const std::vector<std::string>& categories) {
  omni::v1::Article out;
  out.set_id(article.id);
  out.set_source_name(source_name);
  out.set_title(article.title);
  out.set_url(article.url);
  out.set_published_ms(article.published_ms);
  out.set_fetched_ms(article.fetched_ms);
  out.set_summary(article.summary);
  out.set_content(article.content);
  out.set_image_url(article.image_url);
  out.set_image_alt(article.image_alt);
  if (article.sentiment_score) out.set_sentiment_score(*article.sentiment_score);
  out.set_sentiment_label(article.sentiment_label);
  out.set_is_processed(article.is_processed);
  for (const auto& category : categories) {
    out.add_categories(category);
  }
  return out;
}

} // namespace omni::service
