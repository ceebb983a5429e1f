#include "item_pool.hpp"

#include <algorithm>

namespace framecomp::bulk {

ItemPool::ItemPool(size_t threads) {
  threads = std::max<size_t>(threads, 1);
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&ItemPool::Run, this);
  }
}

ItemPool::~ItemPool() {
  Stop();
}

bool ItemPool::Submit(std::function<void()> task) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return false;
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void ItemPool::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void ItemPool::Run() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

} // namespace framecomp::bulk
