#pragma once

#include <map>
#include <mutex>
#include <string>

#include "repository.h"

// In-process store; values are kept serialized so callers never share state.
class MemoryRepository : public DocumentRepository {
  public:
	DbResult<std::vector<JsonDocument>> fetchAll(const std::string &keyPrefix) override;
	DbResult<JsonDocument> fetchOne(const std::string &key) override;
	DbStatus put(const std::string &key, JsonObjectConst doc) override;
	DbResult<bool> remove(const std::string &key) override;
	DbResult<std::vector<std::string>> listKeys(const std::string &keyPrefix) override;

	size_t size() const;
	void clear();

  private:
	mutable std::mutex _mu; // guards _values
	std::map<std::string, std::string> _values;
};
