#ifndef MCBALANCER_SRVRESOLVER_HPP
#define MCBALANCER_SRVRESOLVER_HPP

#include <compare>
#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <string_view>

namespace mcbalancer::_impl {

struct SrvRecord {
	const uint16_t priority;
	const uint16_t weight;
	const uint16_t port;
	const std::string target;

	std::weak_ordering operator<=>(const SrvRecord&) const;
};

// Ordered by priority only, records of equal priority keep their answer order
using records_t = std::multiset<SrvRecord>;

// One engine per thread, resolutions run on a thread pool
extern thread_local std::minstd_rand rng;

// Queries `_{service}._{proto}.{domain}`, leading underscores of service and proto are normalized to one
records_t resolve_srv(std::string_view service, std::string_view proto, std::string_view domain);

// RFC 2782 selection among the records sharing the lowest priority
const SrvRecord& pick_record(const records_t& records);

}  // namespace mcbalancer::_impl

#endif  // MCBALANCER_SRVRESOLVER_HPP
