#pragma once

#include <memory>

namespace omni::signal {
class SignalEngine;
}
namespace omni::catalog {
class CatalogStore;
}
namespace omni::content {
class ContentStore;
}
namespace omni::embedding {
class EmbeddingIndex;
}
namespace omni::query {
class QueryViews;
}
namespace omni::db {
class Repository;
}

namespace omni::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<omni::db::Repository>            repository;
  std::shared_ptr<omni::signal::SignalEngine>      engine;
  std::shared_ptr<omni::catalog::CatalogStore>     catalog;
  std::shared_ptr<omni::content::ContentStore>     content;
  std::shared_ptr<omni::embedding::EmbeddingIndex> index;
  std::shared_ptr<omni::query::QueryViews>         views;
};

} // namespace omni::service
