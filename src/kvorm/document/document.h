#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <string>

// System-managed fields, set by Model and never taken from an update patch
static constexpr const char *kIdField = "_id";
static constexpr const char *kCreatedAtField = "createdAt";
static constexpr const char *kUpdatedAtField = "updatedAt";

/**
 * Timestamps are UTC milliseconds read from the system clock.
 */
struct DocumentMeta {
	std::string id;			// 24-hex ObjectId unless supplied by the caller
	uint64_t createdAt = 0; // UTC milliseconds
	uint64_t updatedAt = 0; // UTC milliseconds
};

bool isReservedField(const char *name);

DocumentMeta readMeta(JsonObjectConst doc);

// Sets _id, createdAt and updatedAt
void stampCreated(JsonObject doc, const std::string &id, uint64_t nowMs);
void stampUpdated(JsonObject doc, uint64_t nowMs);

// Shallow merge: top-level keys of `patch` replace those of `target`.
// Reserved fields in the patch are ignored. Returns the number of keys applied.
size_t mergePatch(JsonObject target, JsonObjectConst patch);

// "<namespace>:<collection>:"
std::string collectionKeyPrefix(const std::string &storeNamespace, const std::string &collection);
// "<namespace>:<collection>:<id>"
std::string documentKey(const std::string &storeNamespace, const std::string &collection, const std::string &id);

std::string defaultCollectionName(const std::string &modelName);
