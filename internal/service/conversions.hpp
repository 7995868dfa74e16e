#pragma once

#include <string>
#include <vector>

#include "internal/db/model/article_record.hpp"
#include "internal/db/model/enums.hpp"
#include "internal/db/model/mention_record.hpp"
#include "internal/db/model/observation_record.hpp"
#include "internal/db/model/signal_record.hpp"
#include "omni/v1.hpp"

namespace omni::service {

/*
  Record <-> wire message conversions shared by the services.
*/

db::model::ObservationRecord FromProto(const omni::v1::Observation& observation);

omni::v1::Observation ToProto(const db::model::ObservationRecord& observation, const std::string& symbol);

omni::v1::Signal  ToProto(const db::model::SignalRecord& signal, const std::string& symbol);
omni::v1::Mention ToProto(const db::model::MentionRecord& mention);
omni::v1::Article ToProto(const db::model::ArticleRecord& article, const std::string& source_name, const std::vector<std::string>& categories = {});

omni::v1::SignalKind ToProto(db::model::SignalKind kind);
omni::v1::AssetType  ToProto(db::model::AssetType type);

// util::InvalidArgument for ASSET_TYPE_UNSPECIFIED.
db::model::AssetType FromProto(omni::v1::AssetType type);

} // namespace omni::service
