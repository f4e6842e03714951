#include "query.h"

#include <cstring>

bool queryOpFromString(const std::string &name, QueryOp &out) {
	const auto count = static_cast<uint8_t>(sizeof(kQueryOpNames) / sizeof(kQueryOpNames[0]));
	for (uint8_t i = 0; i < count; ++i) {
		if (name == kQueryOpNames[i]) {
			out = static_cast<QueryOp>(i);
			return true;
		}
	}
	return false;
}

namespace {
DbStatus readCount(JsonVariantConst v, const char *what, std::optional<size_t> &out) {
	if (v.isNull()) return {};
	if (!v.is<int64_t>()) {
		return {DbStatusCode::InvalidArgument, std::string(what) + " must be an integer"};
	}
	const int64_t n = v.as<int64_t>();
	if (n < 0) {
		return {DbStatusCode::InvalidArgument, std::string(what) + " must not be negative"};
	}
	out = static_cast<size_t>(n);
	return {};
}
} // namespace

DbResult<QueryPlan> planFromJson(JsonVariantConst json) {
	DbResult<QueryPlan> res{};
	if (!json.is<JsonObjectConst>()) {
		res.status = {DbStatusCode::InvalidArgument, "query plan must be an object"};
		return res;
	}
	JsonObjectConst obj = json.as<JsonObjectConst>();

	JsonVariantConst filters = obj["filters"];
	if (!filters.isNull() && !filters.is<JsonArrayConst>()) {
		res.status = {DbStatusCode::InvalidArgument, "filters must be an array"};
		return res;
	}
	for (JsonVariantConst f : filters.as<JsonArrayConst>()) {
		const char *field = f["field"] | "";
		const char *opName = f["operator"] | "";
		if (!f.is<JsonObjectConst>() || strlen(field) == 0) {
			res.status = {DbStatusCode::InvalidArgument, "filter requires a field"};
			return res;
		}
		QueryFilter qf;
		qf.field = field;
		if (!queryOpFromString(opName, qf.op)) {
			res.status = {DbStatusCode::InvalidArgument, std::string("unknown operator '") + opName + "'"};
			return res;
		}
		qf.value.set(f["value"]);
		res.value.filters.push_back(std::move(qf));
	}

	JsonVariantConst sort = obj["sort"];
	if (!sort.isNull()) {
		const char *field = sort["field"] | "";
		if (!sort.is<JsonObjectConst>() || strlen(field) == 0) {
			res.status = {DbStatusCode::InvalidArgument, "sort requires a field"};
			return res;
		}
		SortSpec spec;
		spec.field = field;
		const std::string order = sort["order"] | "asc";
		if (order == "desc") {
			spec.order = SortOrder::Desc;
		} else if (order != "asc") {
			res.status = {DbStatusCode::InvalidArgument, "sort order must be asc or desc"};
			return res;
		}
		res.value.sort = spec;
	}

	auto st = readCount(obj["skip"], "skip", res.value.skip);
	if (st.ok()) st = readCount(obj["limit"], "limit", res.value.limit);
	res.status = st;
	return res;
}

JsonDocument planToJson(const QueryPlan &plan) {
	JsonDocument doc;
	JsonArray filters = doc["filters"].to<JsonArray>();
	for (const auto &f : plan.filters) {
		JsonObject o = filters.add<JsonObject>();
		o["field"] = f.field;
		o["operator"] = queryOpToString(f.op);
		o["value"] = f.value.as<JsonVariantConst>();
	}
	if (plan.sort) {
		doc["sort"]["field"] = plan.sort->field;
		doc["sort"]["order"] = sortOrderToString(plan.sort->order);
	}
	if (plan.skip) doc["skip"] = *plan.skip;
	if (plan.limit) doc["limit"] = *plan.limit;
	return doc;
}
