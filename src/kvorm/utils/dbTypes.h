#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <string>
#include <utility>

enum class DbStatusCode : uint8_t {
	Ok = 0,
	NotFound,
	AlreadyExists,
	InvalidArgument,
	ValidationFailed,
	IoError,
	Corrupted,
	Unavailable,
	Unknown
};

struct OrmConfig {
	std::string storeNamespace = "kvorm"; // first key segment, must not contain ':'
	bool validate = true;				  // global schema enforcement switch
	std::string logLevel = "info";		  // spdlog level name
};

enum class DBEventType : uint8_t {
	DocumentCreated = 0,
	DocumentUpdated,
	DocumentDeleted,
	ModelRegistered,
	ModelDropped,
	CollectionDropped
};

// Human-readable descriptions for DBEventType values.
static constexpr const char *kDBEventTypeDescriptions[] = {
	"Document created",
	"Document updated",
	"Document deleted",
	"Model registered",
	"Model dropped",
	"Collection dropped"};

inline const char *dbEventTypeToString(DBEventType ev) {
	const auto idx = static_cast<uint8_t>(ev);
	const auto count = static_cast<uint8_t>(sizeof(kDBEventTypeDescriptions) / sizeof(kDBEventTypeDescriptions[0]));
	return (idx < count) ? kDBEventTypeDescriptions[idx] : "Unknown";
}

// Human-readable descriptions for DbStatusCode values.
static constexpr const char *kDbStatusCodeDescriptions[] = {
	"Ok",
	"Not found",
	"Already exists",
	"Invalid argument",
	"Validation failed",
	"I/O error",
	"Corrupted",
	"Repository unavailable",
	"Unknown",
};

inline const char *dbStatusCodeToString(DbStatusCode code) {
	const auto idx = static_cast<uint8_t>(code);
	const auto count = static_cast<uint8_t>(sizeof(kDbStatusCodeDescriptions) / sizeof(kDbStatusCodeDescriptions[0]));
	return (idx < count) ? kDbStatusCodeDescriptions[idx] : "Unknown";
}

struct DbStatus {
	DbStatusCode code = DbStatusCode::Ok;
	std::string message;
	DbStatus() = default;
	DbStatus(DbStatusCode c, std::string msg) : code(c), message(std::move(msg)) {}
	bool ok() const { return code == DbStatusCode::Ok; }
};

template <typename T>
struct DbResult {
	DbStatus status;
	T value{};
};
