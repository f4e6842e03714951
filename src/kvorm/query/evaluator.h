#pragma once

#include <ArduinoJson.h>

#include <optional>
#include <string>
#include <vector>

#include "query.h"

/*
	In-memory evaluation of a QueryPlan over a fetched document set:
	filter (all filters AND-combined), stable sort, then skip and limit.
	Stateless; every call scans the whole input.
*/
class QueryEvaluator {
  public:
	static std::vector<JsonDocument> apply(const std::vector<JsonDocument> &docs, const QueryPlan &plan);

	static bool matches(JsonObjectConst doc, const std::vector<QueryFilter> &filters);
	static bool matchesFilter(JsonVariantConst fieldValue, QueryOp op, JsonVariantConst filterValue);

	// eq semantics: absent equals null, numbers compare numerically, other
	// values must share a JSON type and be structurally equal
	static bool valuesEqual(JsonVariantConst a, JsonVariantConst b);

	// Ordering used by gt/gte/lt/lte; empty when the operands do not compare
	static std::optional<int> compareValues(JsonVariantConst a, JsonVariantConst b);

	// Total order for sorting:
	// null < boolean < number < string < array < object
	static int sortCompare(JsonVariantConst a, JsonVariantConst b);

	static std::string stringify(JsonVariantConst v);
};
