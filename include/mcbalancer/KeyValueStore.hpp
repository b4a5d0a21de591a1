#ifndef MCBALANCER_KEYVALUESTORE_HPP
#define MCBALANCER_KEYVALUESTORE_HPP

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcbalancer {

class KeyValueStore {
public:
	virtual ~KeyValueStore() = default;

	[[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
	virtual void put(const std::string& key, const std::string& value) = 0;
};

class MemoryStore : public KeyValueStore {
public:
	[[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
	void put(const std::string& key, const std::string& value) override;

protected:
	mutable std::mutex mutex;
	std::map<std::string, std::string> entries;
};

/**
 * Keeps all entries in memory and persists them as JSON lines, one `{"key":..,"value":..}` object per put().
 *
 * put() only appends, loading replays the lines and the last write of a key wins. An unterminated last line is a
 * write torn by a crash and is skipped. Throws std::runtime_error if the file exists but can't be read, or if a
 * complete line can't be parsed.
 */
class JsonFileStore : public MemoryStore {
public:
	explicit JsonFileStore(std::filesystem::path path);

	void put(const std::string& key, const std::string& value) override;

private:
	std::filesystem::path path;
	std::ofstream log;
	bool unterminated = false;

	void load();
	void append(const std::string& key, const std::string& value);
};

}  // namespace mcbalancer

#endif  // MCBALANCER_KEYVALUESTORE_HPP
