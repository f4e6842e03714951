#pragma once

#include <ArduinoJson.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "query.h"

class Model;

/*
	Fluent construction of a QueryPlan bound to one model:

		auto adults = users->query()
			.filter("age", QueryOp::Gte, 18)
			.sort("name")
			.limit(10)
			.exec();

	The plan is copied when a terminal call runs, so a builder can be reused.
*/
class QueryBuilder {
  public:
	explicit QueryBuilder(const Model &model) : _model(&model) {}

	template <typename T>
	QueryBuilder &filter(const std::string &field, QueryOp op, T value) {
		QueryFilter f;
		f.field = field;
		f.op = op;
		f.value.set(value);
		_plan.filters.push_back(std::move(f));
		return *this;
	}

	// Array operand for in / not_in
	template <typename T>
	QueryBuilder &filter(const std::string &field, QueryOp op, const std::vector<T> &values) {
		QueryFilter f;
		f.field = field;
		f.op = op;
		JsonArray arr = f.value.to<JsonArray>();
		for (const auto &v : values)
			arr.add(v);
		_plan.filters.push_back(std::move(f));
		return *this;
	}

	// Shorthand for an eq filter
	template <typename T>
	QueryBuilder &where(const std::string &field, T value) {
		return filter(field, QueryOp::Eq, value);
	}

	QueryBuilder &sort(const std::string &field, SortOrder order = SortOrder::Asc);
	QueryBuilder &skip(size_t n);
	QueryBuilder &limit(size_t n);

	const QueryPlan &plan() const { return _plan; }

	DbResult<std::vector<JsonDocument>> exec() const;
	DbResult<size_t> count() const;
	DbResult<JsonDocument> first() const;

  private:
	const Model *_model;
	QueryPlan _plan;
};
