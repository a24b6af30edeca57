#ifndef SUPERVISOR_EXECUTION_POOL_HPP
#define SUPERVISOR_EXECUTION_POOL_HPP

#include <atomic>
#include <cstdint>

#include <kj/common.h>

namespace supervisor {

// Bounds the number of executions running at the same time. Requests over
// capacity are rejected immediately, nothing is queued. Thread-safe.
class ExecutionPool {
 public:
  // Capacity taken by one admitted execution, given back on destruction.
  class Slot {
   public:
    Slot(Slot&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
    Slot& operator=(Slot&& other) noexcept;
    ~Slot() { Release(); }
    KJ_DISALLOW_COPY(Slot);

   private:
    friend class ExecutionPool;
    explicit Slot(ExecutionPool* pool) : pool_(pool) {}
    void Release();

    ExecutionPool* pool_;
  };

  explicit ExecutionPool(int32_t capacity) : capacity_(capacity) {}
  KJ_DISALLOW_COPY(ExecutionPool);

  // Returns a slot, or nullptr if the pool is at capacity.
  kj::Maybe<Slot> Admit();

  int32_t Running() const { return running_.load(); }
  int32_t Capacity() const { return capacity_; }

 private:
  const int32_t capacity_;
  std::atomic<int32_t> running_{0};
};

}  // namespace supervisor

#endif
