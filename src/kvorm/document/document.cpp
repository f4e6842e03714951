#include "document.h"

#include <cctype>
#include <cstring>

bool isReservedField(const char *name) {
	if (!name) return false;
	return strcmp(name, kIdField) == 0 || strcmp(name, kCreatedAtField) == 0 || strcmp(name, kUpdatedAtField) == 0;
}

DocumentMeta readMeta(JsonObjectConst doc) {
	DocumentMeta meta;
	meta.id = doc[kIdField] | "";
	meta.createdAt = doc[kCreatedAtField] | static_cast<uint64_t>(0);
	meta.updatedAt = doc[kUpdatedAtField] | static_cast<uint64_t>(0);
	return meta;
}

void stampCreated(JsonObject doc, const std::string &id, uint64_t nowMs) {
	doc[kIdField] = id;
	doc[kCreatedAtField] = nowMs;
	doc[kUpdatedAtField] = nowMs;
}

void stampUpdated(JsonObject doc, uint64_t nowMs) {
	const uint64_t created = readMeta(doc).createdAt;
	doc[kUpdatedAtField] = nowMs < created ? created : nowMs;
}

size_t mergePatch(JsonObject target, JsonObjectConst patch) {
	size_t applied = 0;
	for (JsonPairConst kv : patch) {
		if (isReservedField(kv.key().c_str())) continue;
		target[kv.key().c_str()] = kv.value();
		++applied;
	}
	return applied;
}

std::string collectionKeyPrefix(const std::string &storeNamespace, const std::string &collection) {
	return storeNamespace + ":" + collection + ":";
}

std::string documentKey(const std::string &storeNamespace, const std::string &collection, const std::string &id) {
	return collectionKeyPrefix(storeNamespace, collection) + id;
}

std::string defaultCollectionName(const std::string &modelName) {
	std::string out = modelName;
	for (auto &c : out) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return out;
}
