#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace framecomp::bulk {

/*
  Fixed set of threads executing item tasks.

  At most Size() tasks run at once across every active run; everything
  beyond that waits in FIFO order. Tasks must not throw.
*/
class ItemPool {
 public:
  explicit ItemPool(size_t threads);
  ~ItemPool();

  ItemPool(const ItemPool&)            = delete;
  ItemPool& operator=(const ItemPool&) = delete;

  // false once Stop() was called
  bool Submit(std::function<void()> task);

  // Drains queued tasks, then joins the threads.
  void Stop();

  size_t Size() const {
    return threads_.size();
  }

 private:
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> tasks_;
  bool                              stopping_ = false;

  std::vector<std::thread> threads_;
};

} // namespace framecomp::bulk
