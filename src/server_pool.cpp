#include "ccsim/server_pool.hpp"
#include <algorithm>

namespace ccsim {

void ServerPool::advance() noexcept {
  for (auto& s : servers_) {
    if (s.remaining_service > 0) --s.remaining_service;
  }
}

std::optional<AgentIdx> ServerPool::lowest_idle() const noexcept {
  auto it = std::find_if(servers_.begin(), servers_.end(),
                         [](const Server& s) { return s.idle(); });
  if (it == servers_.end()) return std::nullopt;
  return static_cast<AgentIdx>(it - servers_.begin());
}

bool ServerPool::assign(AgentIdx idx, Duration service) noexcept {
  if (idx >= servers_.size() || service <= 0) return false;
  auto& s = servers_[idx];
  if (!s.idle()) return false;
  s.remaining_service = service;
  return true;
}

std::size_t ServerPool::busy_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(servers_.begin(), servers_.end(),
                    [](const Server& s) { return !s.idle(); }));
}

} // namespace ccsim
