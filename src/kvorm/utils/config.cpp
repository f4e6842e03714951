#include "config.h"

#include "log.h"

#include <fstream>

DbStatus validateConfig(const OrmConfig &cfg) {
	if (cfg.storeNamespace.empty()) {
		return {DbStatusCode::InvalidArgument, "storeNamespace must not be empty"};
	}
	if (cfg.storeNamespace.find(':') != std::string::npos) {
		return {DbStatusCode::InvalidArgument, "storeNamespace must not contain ':'"};
	}
	spdlog::level::level_enum lvl;
	if (!parseLogLevel(cfg.logLevel, lvl)) {
		return {DbStatusCode::InvalidArgument, "unknown log level '" + cfg.logLevel + "'"};
	}
	return {};
}

DbResult<OrmConfig> configFromJson(JsonVariantConst json) {
	DbResult<OrmConfig> res{};
	if (!json.is<JsonObjectConst>()) {
		res.status = {DbStatusCode::InvalidArgument, "config must be an object"};
		return res;
	}
	JsonVariantConst ns = json["storeNamespace"];
	if (!ns.isNull()) {
		if (!ns.is<const char *>()) {
			res.status = {DbStatusCode::InvalidArgument, "storeNamespace must be a string"};
			return res;
		}
		res.value.storeNamespace = ns.as<const char *>();
	}
	JsonVariantConst validate = json["validate"];
	if (!validate.isNull()) {
		if (!validate.is<bool>()) {
			res.status = {DbStatusCode::InvalidArgument, "validate must be a boolean"};
			return res;
		}
		res.value.validate = validate.as<bool>();
	}
	JsonVariantConst level = json["logLevel"];
	if (!level.isNull()) {
		if (!level.is<const char *>()) {
			res.status = {DbStatusCode::InvalidArgument, "logLevel must be a string"};
			return res;
		}
		res.value.logLevel = level.as<const char *>();
	}
	res.status = validateConfig(res.value);
	return res;
}

JsonDocument configToJson(const OrmConfig &cfg) {
	JsonDocument doc;
	doc["storeNamespace"] = cfg.storeNamespace;
	doc["validate"] = cfg.validate;
	doc["logLevel"] = cfg.logLevel;
	return doc;
}

DbResult<OrmConfig> loadConfigFile(const std::string &path) {
	DbResult<OrmConfig> res{};
	std::ifstream in(path);
	if (!in) {
		res.status = {DbStatusCode::IoError, "open for read failed: " + path};
		return res;
	}
	JsonDocument doc;
	auto err = deserializeJson(doc, in);
	if (err) {
		res.status = {DbStatusCode::Corrupted, std::string("config decode failed: ") + err.c_str()};
		return res;
	}
	return configFromJson(doc.as<JsonVariantConst>());
}
