#pragma once

#include <ArduinoJson.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "../document/document.h"
#include "../query/query.h"
#include "../query/queryBuilder.h"
#include "../repository/repository.h"
#include "../utils/dbTypes.h"
#include "../utils/schema.h"
#include "../utils/validator.h"

class KvOrm;

struct ModelOptions {
	std::string collection; // defaults to the lower-cased model name
	bool validate = true;
};

/*
	CRUD and query surface of one collection. Writes are validated against the
	model's schema before the repository is touched; reads fetch the whole
	collection and evaluate the plan in memory.

	Calls returning a ValidationError through `verr` fill it whenever the
	pointer is non-null (success included).
*/
class Model {
  public:
	Model(KvOrm &orm, const std::string &name, const Schema &schema, const ModelOptions &opts);

	const std::string &name() const { return _name; }
	const std::string &collection() const { return _collection; }
	const Schema &schema() const { return _schema; }
	bool validates() const;

	std::string keyFor(const std::string &id) const;
	std::string keyPrefix() const;

	// Create from an object; returns the stored document (with _id and timestamps)
	DbResult<JsonDocument> create(JsonObjectConst data, ValidationError *verr = nullptr);
	DbResult<JsonDocument> create(const JsonDocument &data, ValidationError *verr = nullptr);

	// Creates every object entry in order, skipping non-objects.
	// Stops at the first failure, returning the documents created before it.
	DbResult<std::vector<JsonDocument>> createMany(JsonArrayConst arr);
	DbResult<std::vector<JsonDocument>> createMany(const JsonDocument &arrDoc);

	DbResult<std::vector<JsonDocument>> find() const;
	DbResult<std::vector<JsonDocument>> find(const QueryPlan &plan) const;
	DbResult<JsonDocument> findById(const std::string &id) const;

	// First match of the plan (skip honoured); NotFound when nothing matches
	DbResult<JsonDocument> findOne(const QueryPlan &plan) const;
	// First document whose fields equal every key of `filter`
	DbResult<JsonDocument> findOne(const JsonDocument &filter) const;

	// Shallow-merge `patch` into the stored document and re-stamp updatedAt
	DbResult<JsonDocument> update(const std::string &id, JsonObjectConst patch, ValidationError *verr = nullptr);
	DbResult<JsonDocument> update(const std::string &id, const JsonDocument &patch, ValidationError *verr = nullptr);
	DbResult<size_t> updateMany(const QueryPlan &plan, JsonObjectConst patch, ValidationError *verr = nullptr);

	// value == false when no such document exists
	DbResult<bool> removeById(const std::string &id);
	DbResult<size_t> removeMany(const QueryPlan &plan);

	DbResult<size_t> count() const;
	DbResult<size_t> count(const QueryPlan &plan) const;
	DbResult<bool> exists(const std::string &id) const;

	QueryBuilder query() const { return QueryBuilder(*this); }

  private:
	KvOrm *_orm = nullptr;
	std::string _name;
	std::string _collection;
	const Schema _schema;
	bool _validate = true;

	DbResult<std::shared_ptr<DocumentRepository>> repo() const;
	ValidationError runValidation(JsonObjectConst candidate, bool partial) const;
	DbStatus recordStatus(const DbStatus &st) const;
	void emitEvent(DBEventType ev) const;
};
