#pragma once

#include <ArduinoJson.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "model/model.h"
#include "repository/repository.h"
#include "utils/config.h"
#include "utils/dbTypes.h"
#include "utils/schema.h"

class KvOrm {
  public:
	~KvOrm();
	DbStatus init(std::shared_ptr<DocumentRepository> repository, const OrmConfig &cfg = {});

	// Replace configuration (namespace, validation switch, log level)
	DbStatus changeConfig(const OrmConfig &cfg);
	OrmConfig config() const;

	// Register a model; AlreadyExists (with the registered model) when the name is taken
	DbResult<Model *> model(const std::string &name, const Schema &schema, const ModelOptions &opts = {});
	// Look up a registered model
	DbResult<Model *> model(const std::string &name);

	// Forget a model; its documents stay in the repository
	DbStatus dropModel(const std::string &name);

	// Delete every document of a collection; returns how many were removed
	DbResult<size_t> dropCollection(const std::string &collection);

	std::vector<std::string> getAllModelNames();

	// Repository reachability
	DbStatus health();

	// Register a generic event callback
	void onEvent(const std::function<void(DBEventType)> &cb);

	// Register callback for error notifications
	void onError(const std::function<void(const DbStatus &)> &cb);

	std::shared_ptr<DocumentRepository> repository() const;

	// Retrieve last error or success status
	DbStatus lastError() const;

	// Allow models to update diagnostics/error state
	DbStatus recordStatus(const DbStatus &st) { return setLastError(st); }

	// Diagnostics: models, their collections and document counts, config
	JsonDocument getDiag();

	void emitEvent(DBEventType ev);
	void emitError(const DbStatus &st);

  private:
	OrmConfig _cfg;
	std::shared_ptr<DocumentRepository> _repo;
	std::map<std::string, std::unique_ptr<Model>> _models;
	std::vector<std::function<void(DBEventType)>> _eventCbs;
	std::vector<std::function<void(const DbStatus &)>> _errorCbs;
	mutable std::mutex _mu; // guards everything above and _lastError

	// Tracks most recent status for diagnostics/debugging
	DbStatus _lastError{DbStatusCode::Ok, ""};

	DbStatus setLastError(const DbStatus &st);
	void applyLogLevel(const std::string &level);
};
