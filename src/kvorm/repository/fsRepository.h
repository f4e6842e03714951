#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "repository.h"

/*
	File-backed store: one JSON file per key, the key segments forming the path
	("ns:users:42" -> <baseDir>/ns/users/42.json). Files are written to a
	temporary sibling and renamed into place.
*/
class FsRepository : public DocumentRepository {
  public:
	explicit FsRepository(std::string baseDir);

	// Creates the base directory; Unavailable when that fails
	DbStatus init();

	DbResult<std::vector<JsonDocument>> fetchAll(const std::string &keyPrefix) override;
	DbResult<JsonDocument> fetchOne(const std::string &key) override;
	DbStatus put(const std::string &key, JsonObjectConst doc) override;
	DbResult<bool> remove(const std::string &key) override;
	DbResult<std::vector<std::string>> listKeys(const std::string &keyPrefix) override;
	DbStatus ping() override;

	const std::string &baseDir() const { return _baseDir; }

  private:
	std::string _baseDir;
	std::mutex _mu; // serializes filesystem access

	DbResult<std::string> pathForKey(const std::string &key) const;
	DbResult<std::vector<std::string>> listKeysUnlocked(const std::string &keyPrefix) const;
	DbResult<JsonDocument> readFileUnlocked(const std::string &path) const;
};
