#pragma once
#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace ccsim {

// Owns worker threads and joins every started one on destruction,
// including when a later spawn throws.
class WorkerGroup {
public:
  WorkerGroup() = default;
  ~WorkerGroup() { join(); }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  void reserve(std::size_t n) { workers_.reserve(n); }

  template <typename Fn>
  void spawn(Fn&& fn) {
    workers_.emplace_back(std::forward<Fn>(fn));
  }

  void join() noexcept {
    for (auto& th : workers_) {
      if (th.joinable()) th.join();
    }
  }

  std::size_t size() const noexcept { return workers_.size(); }

private:
  std::vector<std::thread> workers_;
};

} // namespace ccsim
