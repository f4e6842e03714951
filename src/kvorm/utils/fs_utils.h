#pragma once

#include <filesystem>
#include <string>
#include <system_error>

std::string joinPath(const std::string &a, const std::string &b);

inline bool fsEnsureDir(const std::string &path) {
	if (path.empty() || path == "/") return true;
	std::error_code ec;
	if (std::filesystem::is_directory(path, ec)) return true;
	std::filesystem::create_directories(path, ec);
	return !ec && std::filesystem::is_directory(path, ec);
}

inline std::string joinPath(const std::string &a, const std::string &b) {
	if (!b.empty() && b.front() == '/') return b;
	if (a.empty()) return b;
	if (a.back() == '/') {
		return b.empty() ? a : a + b;
	}
	if (b.empty()) return a;
	return a + "/" + b;
}
