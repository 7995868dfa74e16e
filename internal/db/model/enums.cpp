#include "enums.hpp"

namespace omni::db::model {

std::string_view ToString(AssetStatus status) {
  switch (status) {
    case AssetStatus::kActive:
      return "active";
    case AssetStatus::kInactive:
      return "inactive";
  }
  return "active";
}

std::string_view ToString(SignalKind kind) {
  switch (kind) {
    case SignalKind::kBuy:
      return "buy";
    case SignalKind::kSell:
      return "sell";
    case SignalKind::kHold:
      return "hold";
  }
  return "hold";
}

std::string_view ToString(AssetType type) {
  switch (type) {
    case AssetType::kStock:
      return "stock";
    case AssetType::kCrypto:
      return "crypto";
  }
  return "crypto";
}

std::optional<AssetStatus> ParseAssetStatus(std::string_view text) {
  if (text == "active") return AssetStatus::kActive;
  if (text == "inactive") return AssetStatus::kInactive;
  return std::nullopt;
}

std::optional<SignalKind> ParseSignalKind(std::string_view text) {
  if (text == "buy") return SignalKind::kBuy;
  if (text == "sell") return SignalKind::kSell;
  if (text == "hold") return SignalKind::kHold;
  return std::nullopt;
}

std::optional<AssetType> ParseAssetType(std::string_view text) {
  if (text == "stock") return AssetType::kStock;
  if (text == "crypto") return AssetType::kCrypto;
  return std::nullopt;
}

} // namespace omni::db::model
