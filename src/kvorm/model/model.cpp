#include "model.h"

#include <algorithm>

#include "../orm.h"
#include "../query/evaluator.h"
#include "../utils/log.h"
#include "../utils/objectId.h"
#include "../utils/time_utils.h"

Model::Model(KvOrm &orm, const std::string &name, const Schema &schema, const ModelOptions &opts)
	: _orm(&orm),
	  _name(name),
	  _collection(opts.collection.empty() ? defaultCollectionName(name) : opts.collection),
	  _schema(schema),
	  _validate(opts.validate) {}

bool Model::validates() const {
	return _validate && _orm->config().validate;
}

std::string Model::keyPrefix() const {
	return collectionKeyPrefix(_orm->config().storeNamespace, _collection);
}

std::string Model::keyFor(const std::string &id) const {
	return documentKey(_orm->config().storeNamespace, _collection, id);
}

DbResult<std::shared_ptr<DocumentRepository>> Model::repo() const {
	DbResult<std::shared_ptr<DocumentRepository>> res{};
	res.value = _orm->repository();
	if (!res.value) res.status = {DbStatusCode::Unavailable, "repository not initialized"};
	return res;
}

ValidationError Model::runValidation(JsonObjectConst candidate, bool partial) const {
	if (!validates()) return ValidationError::success();
	auto ve = validateDocument(_schema, candidate, partial);
	if (!ve.valid) {
		ormLogger()->warn("{}: rejected write: {}", _name, ve.message);
	}
	return ve;
}

DbStatus Model::recordStatus(const DbStatus &st) const {
	if (!st.ok() && st.code != DbStatusCode::NotFound && st.code != DbStatusCode::ValidationFailed) {
		ormLogger()->error("{}: {} ({})", _name, st.message, dbStatusCodeToString(st.code));
	}
	return _orm->recordStatus(st);
}

void Model::emitEvent(DBEventType ev) const {
	_orm->emitEvent(ev);
}

DbResult<JsonDocument> Model::create(JsonObjectConst data, ValidationError *verr) {
	DbResult<JsonDocument> res{};
	if (verr) *verr = ValidationError::success();
	if (data.isNull()) {
		res.status = recordStatus({DbStatusCode::InvalidArgument, "document must be an object"});
		return res;
	}
	auto ve = runValidation(data, false);
	if (verr) *verr = ve;
	if (!ve.valid) {
		res.status = recordStatus({DbStatusCode::ValidationFailed, ve.message});
		return res;
	}
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}

	std::string id;
	JsonVariantConst given = data[kIdField];
	if (!given.isNull()) {
		if (!given.is<const char *>() || given.as<std::string>().empty()) {
			res.status = recordStatus({DbStatusCode::InvalidArgument, "_id must be a non-empty string"});
			return res;
		}
		id = given.as<std::string>();
		auto existing = rr.value->fetchOne(keyFor(id));
		if (existing.status.ok()) {
			res.status = recordStatus({DbStatusCode::AlreadyExists, "document '" + id + "' already exists"});
			return res;
		}
		if (existing.status.code != DbStatusCode::NotFound) {
			res.status = recordStatus(existing.status);
			return res;
		}
	} else {
		id = ObjectId().toHex();
	}

	res.value.set(data);
	stampCreated(res.value.as<JsonObject>(), id, nowUtcMs());
	auto st = rr.value->put(keyFor(id), res.value.as<JsonObjectConst>());
	if (!st.ok()) {
		res.value.clear();
		res.status = recordStatus(st);
		return res;
	}
	ormLogger()->debug("{}: created {}", _name, id);
	res.status = recordStatus({DbStatusCode::Ok, ""});
	emitEvent(DBEventType::DocumentCreated);
	return res;
}

DbResult<JsonDocument> Model::create(const JsonDocument &data, ValidationError *verr) {
	if (!data.is<JsonObjectConst>()) {
		if (verr) *verr = ValidationError::success();
		DbResult<JsonDocument> res{};
		res.status = recordStatus({DbStatusCode::InvalidArgument, "document must be an object"});
		return res;
	}
	return create(data.as<JsonObjectConst>(), verr);
}

DbResult<std::vector<JsonDocument>> Model::createMany(JsonArrayConst arr) {
	DbResult<std::vector<JsonDocument>> res{};
	res.value.reserve(arr.size());
	for (JsonVariantConst v : arr) {
		if (!v.is<JsonObjectConst>()) {
			// Skip non-object entries
			continue;
		}
		auto cr = create(v.as<JsonObjectConst>());
		if (!cr.status.ok()) {
			res.status = cr.status;
			return res;
		}
		res.value.push_back(std::move(cr.value));
	}
	res.status = recordStatus({DbStatusCode::Ok, ""});
	return res;
}

DbResult<std::vector<JsonDocument>> Model::createMany(const JsonDocument &arrDoc) {
	if (!arrDoc.is<JsonArrayConst>()) {
		DbResult<std::vector<JsonDocument>> res{};
		res.status = recordStatus({DbStatusCode::InvalidArgument, "document must be an array of objects"});
		return res;
	}
	return createMany(arrDoc.as<JsonArrayConst>());
}

DbResult<std::vector<JsonDocument>> Model::find() const {
	return find(QueryPlan{});
}

DbResult<std::vector<JsonDocument>> Model::find(const QueryPlan &plan) const {
	DbResult<std::vector<JsonDocument>> res{};
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	auto all = rr.value->fetchAll(keyPrefix());
	if (!all.status.ok()) {
		res.status = recordStatus(all.status);
		return res;
	}
	res.value = QueryEvaluator::apply(all.value, plan);
	ormLogger()->debug("{}: query matched {} of {} documents", _name, res.value.size(), all.value.size());
	res.status = recordStatus({DbStatusCode::Ok, ""});
	return res;
}

DbResult<JsonDocument> Model::findById(const std::string &id) const {
	DbResult<JsonDocument> res{};
	if (id.empty()) {
		res.status = recordStatus({DbStatusCode::InvalidArgument, "empty id"});
		return res;
	}
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	res = rr.value->fetchOne(keyFor(id));
	recordStatus(res.status);
	return res;
}

DbResult<JsonDocument> Model::findOne(const QueryPlan &plan) const {
	DbResult<JsonDocument> res{};
	QueryPlan firstOnly = plan;
	firstOnly.limit = std::min(plan.limit.value_or(1), size_t{1});
	auto fr = find(firstOnly);
	if (!fr.status.ok()) {
		res.status = fr.status;
		return res;
	}
	if (fr.value.empty()) {
		res.status = recordStatus({DbStatusCode::NotFound, "no matching document"});
		return res;
	}
	res.value = std::move(fr.value.front());
	return res;
}

DbResult<JsonDocument> Model::findOne(const JsonDocument &filter) const {
	if (!filter.is<JsonObjectConst>()) {
		DbResult<JsonDocument> res{};
		res.status = recordStatus({DbStatusCode::InvalidArgument, "filter must be an object"});
		return res;
	}
	QueryPlan plan;
	for (JsonPairConst kv : filter.as<JsonObjectConst>()) {
		QueryFilter f;
		f.field = kv.key().c_str();
		f.op = QueryOp::Eq;
		f.value.set(kv.value());
		plan.filters.push_back(std::move(f));
	}
	return findOne(plan);
}

DbResult<JsonDocument> Model::update(const std::string &id, JsonObjectConst patch, ValidationError *verr) {
	DbResult<JsonDocument> res{};
	if (verr) *verr = ValidationError::success();
	if (patch.isNull()) {
		res.status = recordStatus({DbStatusCode::InvalidArgument, "patch must be an object"});
		return res;
	}
	auto ve = runValidation(patch, true);
	if (verr) *verr = ve;
	if (!ve.valid) {
		res.status = recordStatus({DbStatusCode::ValidationFailed, ve.message});
		return res;
	}
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	auto current = rr.value->fetchOne(keyFor(id));
	if (!current.status.ok()) {
		res.status = recordStatus(current.status);
		return res;
	}
	res.value = std::move(current.value);
	JsonObject obj = res.value.as<JsonObject>();
	mergePatch(obj, patch);
	stampUpdated(obj, nowUtcMs());
	auto st = rr.value->put(keyFor(id), res.value.as<JsonObjectConst>());
	if (!st.ok()) {
		res.value.clear();
		res.status = recordStatus(st);
		return res;
	}
	ormLogger()->debug("{}: updated {}", _name, id);
	res.status = recordStatus({DbStatusCode::Ok, ""});
	emitEvent(DBEventType::DocumentUpdated);
	return res;
}

DbResult<JsonDocument> Model::update(const std::string &id, const JsonDocument &patch, ValidationError *verr) {
	if (!patch.is<JsonObjectConst>()) {
		if (verr) *verr = ValidationError::success();
		DbResult<JsonDocument> res{};
		res.status = recordStatus({DbStatusCode::InvalidArgument, "patch must be an object"});
		return res;
	}
	return update(id, patch.as<JsonObjectConst>(), verr);
}

DbResult<size_t> Model::updateMany(const QueryPlan &plan, JsonObjectConst patch, ValidationError *verr) {
	DbResult<size_t> res{};
	if (verr) *verr = ValidationError::success();
	if (patch.isNull()) {
		res.status = recordStatus({DbStatusCode::InvalidArgument, "patch must be an object"});
		return res;
	}
	auto ve = runValidation(patch, true);
	if (verr) *verr = ve;
	if (!ve.valid) {
		res.status = recordStatus({DbStatusCode::ValidationFailed, ve.message});
		return res;
	}
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	auto fr = find(plan);
	if (!fr.status.ok()) {
		res.status = fr.status;
		return res;
	}
	const uint64_t now = nowUtcMs();
	for (auto &doc : fr.value) {
		const std::string id = readMeta(doc.as<JsonObjectConst>()).id;
		if (id.empty()) continue;
		JsonObject obj = doc.as<JsonObject>();
		mergePatch(obj, patch);
		stampUpdated(obj, now);
		auto st = rr.value->put(keyFor(id), doc.as<JsonObjectConst>());
		if (!st.ok()) {
			res.status = recordStatus(st);
			return res;
		}
		++res.value;
	}
	ormLogger()->debug("{}: updated {} documents", _name, res.value);
	res.status = recordStatus({DbStatusCode::Ok, ""});
	if (res.value > 0) emitEvent(DBEventType::DocumentUpdated);
	return res;
}

DbResult<bool> Model::removeById(const std::string &id) {
	DbResult<bool> res{};
	if (id.empty()) {
		res.status = recordStatus({DbStatusCode::InvalidArgument, "empty id"});
		return res;
	}
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	res = rr.value->remove(keyFor(id));
	recordStatus(res.status);
	if (res.status.ok() && res.value) {
		ormLogger()->debug("{}: removed {}", _name, id);
		emitEvent(DBEventType::DocumentDeleted);
	}
	return res;
}

DbResult<size_t> Model::removeMany(const QueryPlan &plan) {
	DbResult<size_t> res{};
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	auto fr = find(plan);
	if (!fr.status.ok()) {
		res.status = fr.status;
		return res;
	}
	for (const auto &doc : fr.value) {
		const std::string id = readMeta(doc.as<JsonObjectConst>()).id;
		if (id.empty()) continue;
		auto dr = rr.value->remove(keyFor(id));
		if (!dr.status.ok()) {
			res.status = recordStatus(dr.status);
			return res;
		}
		if (dr.value) ++res.value;
	}
	ormLogger()->debug("{}: removed {} documents", _name, res.value);
	res.status = recordStatus({DbStatusCode::Ok, ""});
	if (res.value > 0) emitEvent(DBEventType::DocumentDeleted);
	return res;
}

DbResult<size_t> Model::count() const {
	DbResult<size_t> res{};
	auto rr = repo();
	if (!rr.status.ok()) {
		res.status = recordStatus(rr.status);
		return res;
	}
	auto keys = rr.value->listKeys(keyPrefix());
	res.status = recordStatus(keys.status);
	if (keys.status.ok()) res.value = keys.value.size();
	return res;
}

DbResult<size_t> Model::count(const QueryPlan &plan) const {
	DbResult<size_t> res{};
	auto fr = find(plan);
	res.status = fr.status;
	if (fr.status.ok()) res.value = fr.value.size();
	return res;
}

DbResult<bool> Model::exists(const std::string &id) const {
	DbResult<bool> res{};
	auto fr = findById(id);
	if (fr.status.ok()) {
		res.value = true;
	} else if (fr.status.code == DbStatusCode::NotFound) {
		res.status = recordStatus({DbStatusCode::Ok, ""});
	} else {
		res.status = fr.status;
	}
	return res;
}
