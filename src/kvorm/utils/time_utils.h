#pragma once

#include <chrono>
#include <cstdint>

// UTC milliseconds since epoch
inline uint64_t nowUtcMs() {
	using namespace std::chrono;
	const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
	return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}
