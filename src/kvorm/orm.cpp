#include "orm.h"

#include "document/document.h"
#include "utils/log.h"

KvOrm::~KvOrm() {
	std::lock_guard<std::mutex> lk(_mu);
	_models.clear();
}

DbStatus KvOrm::init(std::shared_ptr<DocumentRepository> repository, const OrmConfig &cfg) {
	if (!repository) {
		return setLastError({DbStatusCode::InvalidArgument, "repository is required"});
	}
	auto st = validateConfig(cfg);
	if (!st.ok()) return setLastError(st);
	{
		std::lock_guard<std::mutex> lk(_mu);
		_cfg = cfg;
		_repo = std::move(repository);
	}
	applyLogLevel(cfg.logLevel);
	st = health();
	if (!st.ok()) {
		ormLogger()->error("repository is not reachable: {}", st.message);
		return st;
	}
	ormLogger()->info("initialized, namespace '{}'", cfg.storeNamespace);
	return setLastError({DbStatusCode::Ok, ""});
}

DbStatus KvOrm::changeConfig(const OrmConfig &cfg) {
	auto st = validateConfig(cfg);
	if (!st.ok()) return setLastError(st);
	{
		std::lock_guard<std::mutex> lk(_mu);
		_cfg = cfg;
	}
	applyLogLevel(cfg.logLevel);
	return setLastError({DbStatusCode::Ok, ""});
}

OrmConfig KvOrm::config() const {
	std::lock_guard<std::mutex> lk(_mu);
	return _cfg;
}

void KvOrm::applyLogLevel(const std::string &level) {
	spdlog::level::level_enum lvl;
	if (parseLogLevel(level, lvl)) ormLogger()->set_level(lvl);
}

DbResult<Model *> KvOrm::model(const std::string &name, const Schema &schema, const ModelOptions &opts) {
	DbResult<Model *> res{};
	if (name.empty()) {
		res.status = setLastError({DbStatusCode::InvalidArgument, "model name must not be empty"});
		return res;
	}
	const std::string collection = opts.collection.empty() ? defaultCollectionName(name) : opts.collection;
	if (collection.find(':') != std::string::npos) {
		res.status = setLastError({DbStatusCode::InvalidArgument, "collection name must not contain ':'"});
		return res;
	}
	{
		std::lock_guard<std::mutex> lk(_mu);
		auto it = _models.find(name);
		if (it != _models.end()) {
			res.value = it->second.get();
			res.status = {DbStatusCode::AlreadyExists, "model '" + name + "' already registered"};
		} else {
			auto m = std::make_unique<Model>(*this, name, schema, opts);
			res.value = m.get();
			_models.emplace(name, std::move(m));
		}
	}
	if (!res.status.ok()) {
		setLastError(res.status);
		return res;
	}
	ormLogger()->debug("registered model '{}' on collection '{}'", name, collection);
	setLastError({DbStatusCode::Ok, ""});
	// emit outside lock
	emitEvent(DBEventType::ModelRegistered);
	return res;
}

DbResult<Model *> KvOrm::model(const std::string &name) {
	DbResult<Model *> res{};
	{
		std::lock_guard<std::mutex> lk(_mu);
		auto it = _models.find(name);
		if (it != _models.end()) res.value = it->second.get();
	}
	if (!res.value) {
		res.status = setLastError({DbStatusCode::NotFound, "model '" + name + "' not registered"});
	}
	return res;
}

DbStatus KvOrm::dropModel(const std::string &name) {
	bool dropped = false;
	{
		std::lock_guard<std::mutex> lk(_mu);
		dropped = _models.erase(name) > 0;
	}
	if (!dropped) {
		return setLastError({DbStatusCode::NotFound, "model '" + name + "' not registered"});
	}
	emitEvent(DBEventType::ModelDropped);
	return setLastError({DbStatusCode::Ok, ""});
}

DbResult<size_t> KvOrm::dropCollection(const std::string &collection) {
	DbResult<size_t> res{};
	if (collection.empty() || collection.find(':') != std::string::npos) {
		res.status = setLastError({DbStatusCode::InvalidArgument, "invalid collection name"});
		return res;
	}
	auto repo = repository();
	if (!repo) {
		res.status = setLastError({DbStatusCode::Unavailable, "repository not initialized"});
		return res;
	}
	auto keys = repo->listKeys(collectionKeyPrefix(config().storeNamespace, collection));
	if (!keys.status.ok()) {
		res.status = setLastError(keys.status);
		return res;
	}
	for (const auto &key : keys.value) {
		auto rr = repo->remove(key);
		if (!rr.status.ok()) {
			res.status = setLastError(rr.status);
			return res;
		}
		if (rr.value) ++res.value;
	}
	ormLogger()->info("dropped collection '{}' ({} documents)", collection, res.value);
	res.status = setLastError({DbStatusCode::Ok, ""});
	emitEvent(DBEventType::CollectionDropped);
	return res;
}

std::vector<std::string> KvOrm::getAllModelNames() {
	std::vector<std::string> names;
	std::lock_guard<std::mutex> lk(_mu);
	names.reserve(_models.size());
	for (const auto &kv : _models) {
		names.push_back(kv.first);
	}
	return names;
}

DbStatus KvOrm::health() {
	auto repo = repository();
	if (!repo) return setLastError({DbStatusCode::Unavailable, "repository not initialized"});
	return setLastError(repo->ping());
}

void KvOrm::onEvent(const std::function<void(DBEventType)> &cb) {
	std::lock_guard<std::mutex> lk(_mu);
	_eventCbs.push_back(cb);
}

void KvOrm::onError(const std::function<void(const DbStatus &)> &cb) {
	std::lock_guard<std::mutex> lk(_mu);
	_errorCbs.push_back(cb);
}

std::shared_ptr<DocumentRepository> KvOrm::repository() const {
	std::lock_guard<std::mutex> lk(_mu);
	return _repo;
}

DbStatus KvOrm::lastError() const {
	std::lock_guard<std::mutex> lk(_mu);
	return _lastError;
}

DbStatus KvOrm::setLastError(const DbStatus &st) {
	{
		std::lock_guard<std::mutex> lk(_mu);
		_lastError = st;
	}
	if (!st.ok()) emitError(st);
	return st;
}

JsonDocument KvOrm::getDiag() {
	JsonDocument doc;

	// Snapshot state under lock; counting goes through the repository
	std::vector<Model *> models;
	OrmConfig cfgCopy;
	bool hasRepo = false;
	{
		std::lock_guard<std::mutex> lk(_mu);
		for (auto &kv : _models) {
			models.push_back(kv.second.get());
		}
		cfgCopy = _cfg;
		hasRepo = _repo != nullptr;
	}

	doc["models"] = static_cast<uint32_t>(models.size());
	auto per = doc["documentsPerModel"].to<JsonObject>();
	auto cols = doc["collections"].to<JsonObject>();
	for (auto *m : models) {
		auto cr = m->count();
		per[m->name()] = cr.status.ok() ? cr.value : 0;
		cols[m->name()] = m->collection();
	}

	doc["config"] = configToJson(cfgCopy);
	doc["repository"] = hasRepo;
	return doc;
}

void KvOrm::emitEvent(DBEventType ev) {
	std::vector<std::function<void(DBEventType)>> callbacks;
	{
		std::lock_guard<std::mutex> lk(_mu);
		callbacks = _eventCbs; // copy snapshot
	}
	for (auto &fn : callbacks) {
		if (fn) fn(ev);
	}
}

void KvOrm::emitError(const DbStatus &st) {
	std::vector<std::function<void(const DbStatus &)>> callbacks;
	{
		std::lock_guard<std::mutex> lk(_mu);
		callbacks = _errorCbs; // copy snapshot
	}
	for (auto &fn : callbacks) {
		if (fn) fn(st);
	}
}
