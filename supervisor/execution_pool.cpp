#include "supervisor/execution_pool.hpp"

namespace supervisor {

ExecutionPool::Slot& ExecutionPool::Slot::operator=(Slot&& other) noexcept {
  if (this != &other) {
    Release();
    pool_ = other.pool_;
    other.pool_ = nullptr;
  }
  return *this;
}

void ExecutionPool::Slot::Release() {
  if (pool_ == nullptr) return;
  pool_->running_.fetch_sub(1);
  pool_ = nullptr;
}

kj::Maybe<ExecutionPool::Slot> ExecutionPool::Admit() {
  int32_t running = running_.load();
  while (running < capacity_) {
    if (running_.compare_exchange_weak(running, running + 1)) {
      return Slot(this);
    }
  }
  return nullptr;
}

}  // namespace supervisor
