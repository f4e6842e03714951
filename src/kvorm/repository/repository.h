#pragma once

#include <ArduinoJson.h>

#include <string>
#include <vector>

#include "../utils/dbTypes.h"

/*
	Backing store contract. Keys are "<namespace>:<collection>:<id>".
	Implementations must be safe to call from several threads and must return
	a consistent snapshot from a single fetchAll call.
	Transport failures are reported as DbStatusCode::Unavailable.
*/
class DocumentRepository {
  public:
	virtual ~DocumentRepository() = default;

	// All documents whose key starts with `keyPrefix`
	virtual DbResult<std::vector<JsonDocument>> fetchAll(const std::string &keyPrefix) = 0;

	// NotFound when no value is stored under `key`
	virtual DbResult<JsonDocument> fetchOne(const std::string &key) = 0;

	virtual DbStatus put(const std::string &key, JsonObjectConst doc) = 0;

	// value == false when nothing was stored under `key`
	virtual DbResult<bool> remove(const std::string &key) = 0;

	virtual DbResult<std::vector<std::string>> listKeys(const std::string &keyPrefix) = 0;

	virtual DbStatus ping() { return {}; }
};
