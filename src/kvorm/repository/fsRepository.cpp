#include "fsRepository.h"

#include "../utils/fs_utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
static constexpr const char *kExt = ".json";
static constexpr const char *kTmpExt = ".tmp";

std::vector<std::string> splitKey(const std::string &key) {
	std::vector<std::string> parts;
	size_t start = 0;
	while (true) {
		const size_t pos = key.find(':', start);
		parts.push_back(key.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
		if (pos == std::string::npos) break;
		start = pos + 1;
	}
	return parts;
}

bool validSegment(const std::string &seg) {
	if (seg.empty() || seg == "." || seg == "..") return false;
	return seg.find_first_of("/\\") == std::string::npos && seg.find('\0') == std::string::npos;
}

bool endsWith(const std::string &s, const std::string &suffix) {
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

FsRepository::FsRepository(std::string baseDir) : _baseDir(std::move(baseDir)) {}

DbStatus FsRepository::init() {
	std::lock_guard<std::mutex> lk(_mu);
	if (_baseDir.empty()) return {DbStatusCode::InvalidArgument, "empty base directory"};
	if (!fsEnsureDir(_baseDir)) return {DbStatusCode::Unavailable, "cannot create " + _baseDir};
	return {};
}

DbStatus FsRepository::ping() {
	std::lock_guard<std::mutex> lk(_mu);
	std::error_code ec;
	if (!fs::is_directory(_baseDir, ec)) return {DbStatusCode::Unavailable, _baseDir + " is not a directory"};
	return {};
}

DbResult<std::string> FsRepository::pathForKey(const std::string &key) const {
	DbResult<std::string> res{};
	std::string path = _baseDir;
	for (const auto &seg : splitKey(key)) {
		if (!validSegment(seg)) {
			res.status = {DbStatusCode::InvalidArgument, "invalid key '" + key + "'"};
			return res;
		}
		path = joinPath(path, seg);
	}
	res.value = path + kExt;
	return res;
}

DbResult<JsonDocument> FsRepository::readFileUnlocked(const std::string &path) const {
	DbResult<JsonDocument> res{};
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		res.status = {DbStatusCode::IoError, "open for read failed: " + path};
		return res;
	}
	auto err = deserializeJson(res.value, in);
	if (err) {
		res.status = {DbStatusCode::Corrupted, std::string("decode failed: ") + err.c_str()};
		return res;
	}
	if (!res.value.is<JsonObject>()) {
		res.status = {DbStatusCode::Corrupted, "stored value is not an object: " + path};
	}
	return res;
}

DbResult<std::vector<std::string>> FsRepository::listKeysUnlocked(const std::string &keyPrefix) const {
	DbResult<std::vector<std::string>> res{};
	// Complete segments name a directory, the trailing one is a name prefix
	auto parts = splitKey(keyPrefix);
	parts.pop_back();
	std::string dir = _baseDir;
	std::string keyBase;
	for (const auto &seg : parts) {
		if (!validSegment(seg)) {
			res.status = {DbStatusCode::InvalidArgument, "invalid key prefix '" + keyPrefix + "'"};
			return res;
		}
		dir = joinPath(dir, seg);
		keyBase += seg + ":";
	}

	std::error_code ec;
	if (!fs::is_directory(dir, ec)) return res;
	for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
		if (!it->is_regular_file(ec)) continue;
		const std::string name = it->path().filename().string();
		if (!endsWith(name, kExt)) continue;
		std::string key = keyBase;
		const fs::path rel = fs::relative(it->path(), dir, ec);
		if (ec) break;
		for (auto p = rel.begin(); p != rel.end(); ++p) {
			if (p != rel.begin()) key += ":";
			key += p->string();
		}
		key.resize(key.size() - std::char_traits<char>::length(kExt));
		if (key.compare(0, keyPrefix.size(), keyPrefix) == 0) res.value.push_back(std::move(key));
	}
	if (ec) {
		res.status = {DbStatusCode::IoError, "list failed: " + ec.message()};
		res.value.clear();
		return res;
	}
	std::sort(res.value.begin(), res.value.end());
	return res;
}

DbResult<std::vector<std::string>> FsRepository::listKeys(const std::string &keyPrefix) {
	std::lock_guard<std::mutex> lk(_mu);
	return listKeysUnlocked(keyPrefix);
}

DbResult<std::vector<JsonDocument>> FsRepository::fetchAll(const std::string &keyPrefix) {
	DbResult<std::vector<JsonDocument>> res{};
	std::lock_guard<std::mutex> lk(_mu);
	auto keys = listKeysUnlocked(keyPrefix);
	if (!keys.status.ok()) {
		res.status = keys.status;
		return res;
	}
	res.value.reserve(keys.value.size());
	for (const auto &key : keys.value) {
		auto path = pathForKey(key);
		if (!path.status.ok()) {
			res.status = path.status;
			res.value.clear();
			return res;
		}
		auto doc = readFileUnlocked(path.value);
		if (!doc.status.ok()) {
			res.status = doc.status;
			res.value.clear();
			return res;
		}
		res.value.push_back(std::move(doc.value));
	}
	return res;
}

DbResult<JsonDocument> FsRepository::fetchOne(const std::string &key) {
	DbResult<JsonDocument> res{};
	auto path = pathForKey(key);
	if (!path.status.ok()) {
		res.status = path.status;
		return res;
	}
	std::lock_guard<std::mutex> lk(_mu);
	std::error_code ec;
	if (!fs::is_regular_file(path.value, ec)) {
		res.status = {DbStatusCode::NotFound, "document not found"};
		return res;
	}
	return readFileUnlocked(path.value);
}

DbStatus FsRepository::put(const std::string &key, JsonObjectConst doc) {
	if (doc.isNull()) return {DbStatusCode::InvalidArgument, "document must be an object"};
	auto path = pathForKey(key);
	if (!path.status.ok()) return path.status;

	std::lock_guard<std::mutex> lk(_mu);
	const std::string finalPath = path.value;
	if (!fsEnsureDir(fs::path(finalPath).parent_path().string())) {
		return {DbStatusCode::IoError, "mkdir failed"};
	}
	const std::string tmpPath = finalPath + kTmpExt;
	std::error_code ec;
	// Write to temp then rename for atomicity
	{
		std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
		if (!out) return {DbStatusCode::IoError, "open for write failed"};
		serializeJson(doc, out);
		out.flush();
		if (!out) {
			out.close();
			fs::remove(tmpPath, ec);
			return {DbStatusCode::IoError, "write failed"};
		}
	}
	fs::rename(tmpPath, finalPath, ec);
	if (ec) {
		std::error_code ignored;
		fs::remove(tmpPath, ignored);
		return {DbStatusCode::IoError, "rename failed: " + ec.message()};
	}
	return {};
}

DbResult<bool> FsRepository::remove(const std::string &key) {
	DbResult<bool> res{};
	auto path = pathForKey(key);
	if (!path.status.ok()) {
		res.status = path.status;
		return res;
	}
	std::lock_guard<std::mutex> lk(_mu);
	std::error_code ec;
	res.value = fs::remove(path.value, ec);
	if (ec) {
		res.value = false;
		res.status = {DbStatusCode::IoError, "remove failed: " + ec.message()};
	}
	return res;
}
