#include "evaluator.h"

#include <algorithm>
#include <string_view>

namespace {
bool isNumber(JsonVariantConst v) { return v.is<double>(); }

int typeRank(JsonVariantConst v) {
	if (v.isNull()) return 0;
	if (v.is<bool>()) return 1;
	if (isNumber(v)) return 2;
	if (v.is<const char *>()) return 3;
	if (v.is<JsonArrayConst>()) return 4;
	if (v.is<JsonObjectConst>()) return 5;
	return 6;
}

int compareNumbers(double a, double b) {
	if (a < b) return -1;
	if (a > b) return 1;
	return 0;
}

std::string_view stringView(JsonVariantConst v) {
	JsonString s = v.as<JsonString>();
	return std::string_view(s.c_str(), s.size());
}

int compareStrings(std::string_view a, std::string_view b) {
	const int c = a.compare(b);
	return (c > 0) - (c < 0);
}

bool containsEqual(JsonVariantConst list, JsonVariantConst value) {
	for (JsonVariantConst item : list.as<JsonArrayConst>()) {
		if (QueryEvaluator::valuesEqual(value, item)) return true;
	}
	return false;
}
} // namespace

bool QueryEvaluator::valuesEqual(JsonVariantConst a, JsonVariantConst b) {
	if (a.isNull() || b.isNull()) return a.isNull() && b.isNull();
	if (isNumber(a) && isNumber(b)) return a.as<double>() == b.as<double>();
	if (typeRank(a) != typeRank(b)) return false;
	if (a.is<const char *>()) return stringView(a) == stringView(b);
	return a == b;
}

std::optional<int> QueryEvaluator::compareValues(JsonVariantConst a, JsonVariantConst b) {
	if (isNumber(a) && isNumber(b)) return compareNumbers(a.as<double>(), b.as<double>());
	if (a.is<const char *>() && b.is<const char *>()) {
		return compareStrings(stringView(a), stringView(b));
	}
	return std::nullopt;
}

int QueryEvaluator::sortCompare(JsonVariantConst a, JsonVariantConst b) {
	const int ra = typeRank(a);
	const int rb = typeRank(b);
	if (ra != rb) return ra < rb ? -1 : 1;
	switch (ra) {
	case 0:
		return 0;
	case 1:
		return static_cast<int>(a.as<bool>()) - static_cast<int>(b.as<bool>());
	case 2:
		return compareNumbers(a.as<double>(), b.as<double>());
	case 3:
		return compareStrings(stringView(a), stringView(b));
	default:
		return compareStrings(stringify(a), stringify(b));
	}
}

std::string QueryEvaluator::stringify(JsonVariantConst v) {
	if (v.is<const char *>()) return std::string(stringView(v));
	std::string out;
	serializeJson(v, out);
	return out;
}

bool QueryEvaluator::matchesFilter(JsonVariantConst fieldValue, QueryOp op, JsonVariantConst filterValue) {
	switch (op) {
	case QueryOp::Eq:
		return valuesEqual(fieldValue, filterValue);
	case QueryOp::Ne:
		return !valuesEqual(fieldValue, filterValue);
	case QueryOp::Gt:
	case QueryOp::Gte:
	case QueryOp::Lt:
	case QueryOp::Lte: {
		const auto c = compareValues(fieldValue, filterValue);
		if (!c) return false;
		if (op == QueryOp::Gt) return *c > 0;
		if (op == QueryOp::Gte) return *c >= 0;
		if (op == QueryOp::Lt) return *c < 0;
		return *c <= 0;
	}
	case QueryOp::Contains:
		if (fieldValue.isNull()) return false;
		return stringify(fieldValue).find(stringify(filterValue)) != std::string::npos;
	case QueryOp::In:
		if (!filterValue.is<JsonArrayConst>()) return false;
		return containsEqual(filterValue, fieldValue);
	case QueryOp::NotIn:
		if (!filterValue.is<JsonArrayConst>()) return false;
		return !containsEqual(filterValue, fieldValue);
	}
	return false;
}

bool QueryEvaluator::matches(JsonObjectConst doc, const std::vector<QueryFilter> &filters) {
	for (const auto &f : filters) {
		if (!matchesFilter(doc[f.field], f.op, f.value.as<JsonVariantConst>())) return false;
	}
	return true;
}

std::vector<JsonDocument> QueryEvaluator::apply(const std::vector<JsonDocument> &docs, const QueryPlan &plan) {
	std::vector<const JsonDocument *> hits;
	hits.reserve(docs.size());
	for (const auto &d : docs) {
		if (matches(d.as<JsonObjectConst>(), plan.filters)) hits.push_back(&d);
	}

	if (plan.sort) {
		const std::string &field = plan.sort->field;
		const bool desc = plan.sort->order == SortOrder::Desc;
		std::stable_sort(hits.begin(), hits.end(), [&](const JsonDocument *a, const JsonDocument *b) {
			int c = sortCompare((*a)[field], (*b)[field]);
			if (desc) c = -c;
			return c < 0;
		});
	}

	const size_t skip = std::min(plan.skip.value_or(0), hits.size());
	size_t take = hits.size() - skip;
	if (plan.limit) take = std::min(take, *plan.limit);

	std::vector<JsonDocument> out;
	out.reserve(take);
	for (size_t i = skip; i < skip + take; ++i) {
		out.push_back(*hits[i]);
	}
	return out;
}
