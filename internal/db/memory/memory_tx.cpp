#include "memory_tx.hpp"

#include <utility>

namespace omni::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Write(std::vector<std::string> keys, Mutation mutation) {
  mutation(working_);
  for (auto& key : keys) {
    write_keys_.insert(std::move(key));
  }
  redo_.push_back(std::move(mutation));
}

void MemoryTransaction::Commit() {
  if (redo_.empty()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& key : write_keys_) {
    auto it = repo_.key_versions_.find(key);
    if (it != repo_.key_versions_.end() && it->second > snapshot_version_) {
      rolled_back_ = true;
      throw TransactionConflict("transaction conflict: " + key + " was modified by a concurrent transaction");
    }
  }

  for (auto& mutation : redo_) {
    mutation(repo_.committed_);
  }
  const uint64_t version = ++repo_.committed_version_;
  for (const auto& key : write_keys_) {
    repo_.key_versions_[key] = version;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace omni::db::memory
