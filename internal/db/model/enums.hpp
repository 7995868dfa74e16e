#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace omni::db::model {

/*
  Enumerations persisted as lowercase TEXT in every backend.
*/

enum class AssetStatus { kActive, kInactive };

enum class SignalKind { kBuy, kSell, kHold };

enum class AssetType { kStock, kCrypto };

std::string_view ToString(AssetStatus status);
std::string_view ToString(SignalKind kind);
std::string_view ToString(AssetType type);

std::optional<AssetStatus> ParseAssetStatus(std::string_view text);
std::optional<SignalKind>  ParseSignalKind(std::string_view text);
std::optional<AssetType>   ParseAssetType(std::string_view text);

} // namespace omni::db::model
