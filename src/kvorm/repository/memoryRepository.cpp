#include "memoryRepository.h"

namespace {
bool startsWith(const std::string &s, const std::string &prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}

DbStatus decode(const std::string &raw, JsonDocument &out) {
	auto err = deserializeJson(out, raw);
	if (err) return {DbStatusCode::Corrupted, std::string("decode failed: ") + err.c_str()};
	return {};
}
} // namespace

DbResult<std::vector<JsonDocument>> MemoryRepository::fetchAll(const std::string &keyPrefix) {
	DbResult<std::vector<JsonDocument>> res{};
	std::lock_guard<std::mutex> lk(_mu);
	for (auto it = _values.lower_bound(keyPrefix); it != _values.end() && startsWith(it->first, keyPrefix); ++it) {
		JsonDocument doc;
		auto st = decode(it->second, doc);
		if (!st.ok()) {
			res.status = st;
			res.value.clear();
			return res;
		}
		res.value.push_back(std::move(doc));
	}
	return res;
}

DbResult<JsonDocument> MemoryRepository::fetchOne(const std::string &key) {
	DbResult<JsonDocument> res{};
	std::lock_guard<std::mutex> lk(_mu);
	auto it = _values.find(key);
	if (it == _values.end()) {
		res.status = {DbStatusCode::NotFound, "document not found"};
		return res;
	}
	res.status = decode(it->second, res.value);
	return res;
}

DbStatus MemoryRepository::put(const std::string &key, JsonObjectConst doc) {
	if (key.empty()) return {DbStatusCode::InvalidArgument, "empty key"};
	if (doc.isNull()) return {DbStatusCode::InvalidArgument, "document must be an object"};
	std::string raw;
	serializeJson(doc, raw);
	std::lock_guard<std::mutex> lk(_mu);
	_values[key] = std::move(raw);
	return {};
}

DbResult<bool> MemoryRepository::remove(const std::string &key) {
	DbResult<bool> res{};
	std::lock_guard<std::mutex> lk(_mu);
	res.value = _values.erase(key) > 0;
	return res;
}

DbResult<std::vector<std::string>> MemoryRepository::listKeys(const std::string &keyPrefix) {
	DbResult<std::vector<std::string>> res{};
	std::lock_guard<std::mutex> lk(_mu);
	for (auto it = _values.lower_bound(keyPrefix); it != _values.end() && startsWith(it->first, keyPrefix); ++it) {
		res.value.push_back(it->first);
	}
	return res;
}

size_t MemoryRepository::size() const {
	std::lock_guard<std::mutex> lk(_mu);
	return _values.size();
}

void MemoryRepository::clear() {
	std::lock_guard<std::mutex> lk(_mu);
	_values.clear();
}
