#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace omni::db::memory {

/*
  Transaction = snapshot + write set

  Reads see the snapshot taken at Begin. Every write is applied to the
  snapshot right away and recorded with the row keys it touches; Commit
  replays the recorded writes on the committed state unless one of those
  keys was committed by someone else after the snapshot was taken. Writers
  on different assets or articles therefore never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Mutation = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  void Write(std::vector<std::string> keys, Mutation mutation);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  std::set<std::string>   write_keys_;
  std::vector<Mutation>   redo_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace omni::db::memory
