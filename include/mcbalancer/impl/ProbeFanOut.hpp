#ifndef MCBALANCER_PROBEFANOUT_HPP
#define MCBALANCER_PROBEFANOUT_HPP

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "../BackendProbe.hpp"
#include "../BackendServer.hpp"

namespace mcbalancer::_impl {

using probe_results_t = std::vector<std::optional<BackendProbe::players_t>>;

/**
 * Probes every server with at most `window` probes in flight. Result `i` belongs to `servers[i]`; the order in
 * which probes complete doesn't matter.
 */
boost::asio::awaitable<probe_results_t> probe_all(std::shared_ptr<BackendProbe> prober,
                                                  std::vector<BackendServer> servers, std::size_t window,
                                                  std::chrono::milliseconds timeout);

BackendProbe::players_t sum_players(const probe_results_t& results);

}  // namespace mcbalancer::_impl

#endif  // MCBALANCER_PROBEFANOUT_HPP
