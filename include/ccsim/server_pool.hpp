#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "ccsim/types.hpp"

namespace ccsim {

struct Server {
  Duration remaining_service{0};   // 0 = idle

  bool idle() const noexcept { return remaining_service == 0; }
};

// Fixed-size pool of servers for one run.
class ServerPool {
public:
  explicit ServerPool(std::size_t n) : servers_(n) {}

  // Decrement every busy server by one step
  void advance() noexcept;

  // Lowest-indexed idle server, if any
  std::optional<AgentIdx> lowest_idle() const noexcept;

  // Bind work to an idle server. Returns false if idx is out of range or busy.
  bool assign(AgentIdx idx, Duration service) noexcept;

  std::size_t busy_count() const noexcept;
  std::size_t size() const noexcept { return servers_.size(); }

  const Server& at(AgentIdx idx) const { return servers_.at(idx); }

private:
  std::vector<Server> servers_;
};

} // namespace ccsim
