#pragma once

#include <ArduinoJson.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../utils/dbTypes.h"

enum class QueryOp : uint8_t {
	Eq = 0,
	Ne,
	Gt,
	Gte,
	Lt,
	Lte,
	Contains,
	In,
	NotIn,
};

enum class SortOrder : uint8_t {
	Asc = 0,
	Desc,
};

// Wire names, indexed by QueryOp
static constexpr const char *kQueryOpNames[] = {"eq", "ne", "gt", "gte", "lt", "lte", "contains", "in", "not_in"};

inline const char *queryOpToString(QueryOp op) {
	const auto idx = static_cast<uint8_t>(op);
	const auto count = static_cast<uint8_t>(sizeof(kQueryOpNames) / sizeof(kQueryOpNames[0]));
	return (idx < count) ? kQueryOpNames[idx] : "unknown";
}

bool queryOpFromString(const std::string &name, QueryOp &out);

inline const char *sortOrderToString(SortOrder order) {
	return order == SortOrder::Desc ? "desc" : "asc";
}

struct QueryFilter {
	std::string field;
	QueryOp op = QueryOp::Eq;
	JsonDocument value; // null when the filter was built without a value
};

struct SortSpec {
	std::string field;
	SortOrder order = SortOrder::Asc;
};

struct QueryPlan {
	std::vector<QueryFilter> filters; // AND-combined
	std::optional<SortSpec> sort;
	std::optional<size_t> skip;
	std::optional<size_t> limit;

	bool empty() const { return filters.empty() && !sort && !skip && !limit; }
};

// {"filters":[{"field","operator","value"}],"sort":{"field","order"},"skip","limit"}
DbResult<QueryPlan> planFromJson(JsonVariantConst json);
JsonDocument planToJson(const QueryPlan &plan);
