#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/runtime_options.hpp"
#include "internal/util/cancellation.hpp"

namespace omni::db {
class Repository;
}
namespace omni::signal {
class SignalEngine;
class StalenessSweeper;
} // namespace omni::signal
namespace omni::catalog {
class CatalogStore;
}
namespace omni::content {
class ContentStore;
}
namespace omni::embedding {
class EmbeddingFunction;
class EmbeddingIndex;
class EmbedScheduler;
class EmbedWorker;
} // namespace omni::embedding
namespace omni::query {
class QueryViews;
}

namespace omni::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::SignalOptions    signal_options;
  config::EmbeddingOptions embedding_options;

  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<signal::SignalEngine>      engine;
  std::shared_ptr<catalog::CatalogStore>     catalog;
  std::shared_ptr<embedding::EmbeddingIndex> index;
  std::shared_ptr<embedding::EmbedScheduler> embed_scheduler;
  std::shared_ptr<content::ContentStore>     content;
  std::shared_ptr<query::QueryViews>         views;

  std::vector<std::shared_ptr<embedding::EmbedWorker>> embed_workers;
  std::shared_ptr<signal::StalenessSweeper>             sweeper;
};

/*
  BuildRepository

  The ONLY place allowed to know concrete DB types. Runs the schema
  bootstrap for SQL backends.
*/
std::shared_ptr<db::Repository> BuildRepository(const omni::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. With no embedder given, the deterministic hashing
  embedder of the configured dimension is used. No threads are started.
*/
Application Build(const omni::runtime::config::RuntimeConfig& config, std::shared_ptr<embedding::EmbeddingFunction> embedder = nullptr);

// Restart recovery and background work: resumes pending backfills, hydrates
// the search cache, re-queues unprocessed articles, then starts the embed
// workers and the staleness sweeper.
void Start(Application& app, const util::CancellationToken& token);

void Stop(Application& app);

} // namespace omni::factory
