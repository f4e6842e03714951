#include "log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

std::shared_ptr<spdlog::logger> ormLogger() {
	static std::mutex mu;
	std::lock_guard<std::mutex> lk(mu);
	auto logger = spdlog::get(KVORM_LOG_TAG);
	if (!logger) {
		logger = spdlog::stdout_color_mt(KVORM_LOG_TAG);
	}
	return logger;
}

bool parseLogLevel(const std::string &name, spdlog::level::level_enum &out) {
	// from_str maps unknown names to "off", so check the round trip
	const auto lvl = spdlog::level::from_str(name);
	if (lvl == spdlog::level::off && name != "off") return false;
	out = lvl;
	return true;
}
