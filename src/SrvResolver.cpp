#include "mcbalancer/impl/SrvResolver.hpp"

#include <arpa/nameser.h>
#include <netinet/in.h>
#include <resolv.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "mcbalancer/impl/Utils.hpp"

namespace mcbalancer::_impl {

std::weak_ordering SrvRecord::operator<=>(const SrvRecord& rhs) const {
	return this->priority <=> rhs.priority;
}

records_t resolve_srv(std::string_view service, std::string_view proto, std::string_view domain) {
	std::ostringstream ss;
	ss << "_" << strip_leading_underscores(service) << "._" << strip_leading_underscores(proto) << "." << domain;
	const std::string qname = ss.str();

	// Buffer for the DNS response
	std::vector<unsigned char> answer(NS_MAXMSG);
	int len = res_query(qname.c_str(), C_IN, T_SRV, answer.data(), static_cast<int>(answer.size()));
	if (len < 0) {
		throw std::runtime_error("SRV query failed for " + qname);
	}
	// A truncated answer reports the full length
	len = std::min(len, static_cast<int>(answer.size()));

	ns_msg handle;
	if (ns_initparse(answer.data(), len, &handle) < 0) {
		throw std::runtime_error("ns_initparse failed");
	}

	std::uint16_t count = ns_msg_count(handle, ns_s_an);
	records_t results;

	for (std::uint16_t i = 0; i < count; i++) {
		ns_rr rr;
		if (ns_parserr(&handle, ns_s_an, i, &rr) < 0) {
			continue;  // skip malformed
		}

		if (ns_rr_type(rr) != T_SRV || ns_rr_rdlen(rr) < 7) {
			continue;  // Skip non-SRV records
		}

		const unsigned char* rdata = ns_rr_rdata(rr);

		char name[NS_MAXDNAME];
		if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata + 6, name, sizeof(name)) < 0) {
			continue;  // bad target, skip
		}

		results.emplace(static_cast<uint16_t>((rdata[0] << 8) | rdata[1]),
		                static_cast<uint16_t>((rdata[2] << 8) | rdata[3]),
		                static_cast<uint16_t>((rdata[4] << 8) | rdata[5]), name);
	}

	return results;
}

// Initialize the random number generator with an actual random seed, once per thread
thread_local std::minstd_rand rng{std::random_device{}()};

const SrvRecord& pick_record(const records_t& records) {
	if (records.empty()) {
		throw std::runtime_error("No SRV records found");
	}

	// All records sharing the lowest priority
	const auto [first, last] = records.equal_range(*records.begin());

	std::uint32_t total_weight{0};
	for (auto it = first; it != last; ++it) {
		total_weight += it->weight;
	}

	if (total_weight == 0) {
		const auto candidates = static_cast<std::size_t>(std::distance(first, last));
		std::uniform_int_distribution<std::size_t> dist{0, candidates - 1};

		return *std::next(first, static_cast<std::ptrdiff_t>(dist(rng)));
	}

	std::uniform_int_distribution<std::uint32_t> dist{0, total_weight - 1};
	const std::uint32_t rand_weight = dist(rng);

	std::uint32_t weight_running_sum{0};
	for (auto it = first; it != last; ++it) {
		weight_running_sum += it->weight;
		if (rand_weight < weight_running_sum) {
			return *it;
		}
	}

	// Unreachable as long as rand_weight < total_weight
	return *first;
}

}  // namespace mcbalancer::_impl
