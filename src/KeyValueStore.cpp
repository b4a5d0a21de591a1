#include "mcbalancer/KeyValueStore.hpp"

#include <boost/json.hpp>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcbalancer/Logger.hpp"

namespace mcbalancer {

std::optional<std::string> MemoryStore::get(const std::string& key) const {
	const std::lock_guard lock{mutex};

	const auto it = entries.find(key);
	if (it == entries.end()) {
		return std::nullopt;
	}

	return it->second;
}

void MemoryStore::put(const std::string& key, const std::string& value) {
	const std::lock_guard lock{mutex};

	entries.insert_or_assign(key, value);
}

JsonFileStore::JsonFileStore(std::filesystem::path path) : path{std::move(path)} {
	load();
}

void JsonFileStore::put(const std::string& key, const std::string& value) {
	const std::lock_guard lock{mutex};

	append(key, value);
	entries.insert_or_assign(key, value);
}

void JsonFileStore::load() {
	if (!std::filesystem::exists(path)) {
		return;
	}

	std::ifstream file{path};
	if (!file) {
		throw std::runtime_error("Failed to open " + path.string());
	}

	std::string line;
	std::size_t line_number = 0;
	std::optional<std::streamoff> torn_at;
	for (std::streamoff start = file.tellg(); std::getline(file, line); start = file.tellg()) {
		++line_number;
		unterminated = file.eof();
		if (line.empty()) {
			continue;
		}

		boost::system::error_code ec;
		const boost::json::value document = boost::json::parse(line, ec);
		const boost::json::object* record = ec.failed() ? nullptr : document.if_object();
		const boost::json::value* key = record ? record->if_contains(boost::json::string_view{"key"}) : nullptr;
		const boost::json::value* value = record ? record->if_contains(boost::json::string_view{"value"}) : nullptr;

		if (key == nullptr || value == nullptr || !key->is_string() || !value->is_string()) {
			if (!unterminated) {
				throw std::runtime_error("Failed to parse " + path.string() + " line " + std::to_string(line_number));
			}
			torn_at = start;
			break;
		}

		entries.insert_or_assign(key->as_string().c_str(), value->as_string().c_str());
	}

	if (file.bad()) {
		throw std::runtime_error("Failed to read " + path.string());
	}
	file.close();

	if (torn_at) {
		MCBALANCER_LOG_WARN("Dropping torn last line {} of {}", line_number, path.string());
		std::filesystem::resize_file(path, static_cast<std::uintmax_t>(*torn_at));
		unterminated = false;
	}
}

void JsonFileStore::append(const std::string& key, const std::string& value) {
	if (!log.is_open()) {
		if (path.has_parent_path()) {
			std::filesystem::create_directories(path.parent_path());
		}
		log.open(path, std::ios::app);
		if (unterminated) {
			log << '\n';
			unterminated = false;
		}
	}

	boost::json::object record;
	record[boost::json::string_view{"key"}] = boost::json::string_view{key};
	record[boost::json::string_view{"value"}] = boost::json::string_view{value};

	log << boost::json::serialize(record) << '\n';
	log.flush();
	if (!log) {
		log.close();
		throw std::runtime_error("Failed to write " + path.string());
	}
}

}  // namespace mcbalancer
