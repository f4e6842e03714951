#include "objectId.h"

#include <atomic>
#include <ctime>
#include <cstring>
#include <random>

namespace {
static uint32_t readEpochSeconds() {
	time_t now = time(nullptr);
	if (now < 0) now = 0;
	return static_cast<uint32_t>(now);
}

static void writeU32BE(uint8_t *out, uint32_t v) {
	out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
	out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
	out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
	out[3] = static_cast<uint8_t>((v) & 0xFF);
}

static uint8_t hexNibble(char c, bool *ok) {
	if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
	if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(10 + (c - 'a'));
	if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(10 + (c - 'A'));
	if (ok) *ok = false;
	return 0;
}

// Chosen once per process, like the machine/process part of a Mongo ObjectId
static const std::array<uint8_t, 5> &processRandom() {
	static const std::array<uint8_t, 5> bytes = [] {
		std::array<uint8_t, 5> out{};
		std::random_device rd;
		std::mt19937 gen(rd());
		std::uniform_int_distribution<int> dist(0, 255);
		for (auto &b : out)
			b = static_cast<uint8_t>(dist(gen));
		return out;
	}();
	return bytes;
}
} // namespace

ObjectId::ObjectId() {
	writeU32BE(_b.data(), readEpochSeconds());

	const auto &rnd = processRandom();
	memcpy(_b.data() + 4, rnd.data(), rnd.size());

	// 3 bytes: counter (24-bit, big-endian)
	const uint32_t c = nextCounter() & 0xFFFFFFu;
	_b[9] = static_cast<uint8_t>((c >> 16) & 0xFF);
	_b[10] = static_cast<uint8_t>((c >> 8) & 0xFF);
	_b[11] = static_cast<uint8_t>((c) & 0xFF);
}

std::string ObjectId::toHex() const {
	static const char *kHex = "0123456789abcdef";
	std::string out;
	out.resize(24);
	for (size_t i = 0; i < _b.size(); ++i) {
		out[i * 2 + 0] = kHex[(_b[i] >> 4) & 0xF];
		out[i * 2 + 1] = kHex[_b[i] & 0xF];
	}
	return out;
}

uint32_t ObjectId::seconds() const {
	return (static_cast<uint32_t>(_b[0]) << 24) | (static_cast<uint32_t>(_b[1]) << 16) |
		   (static_cast<uint32_t>(_b[2]) << 8) | static_cast<uint32_t>(_b[3]);
}

ObjectId ObjectId::fromHex(const std::string &hex, bool *ok) {
	if (ok) *ok = true;
	ObjectId out;
	if (hex.size() != 24) {
		if (ok) *ok = false;
		return out;
	}
	for (size_t i = 0; i < 12; ++i) {
		uint8_t hi = hexNibble(hex[i * 2], ok);
		uint8_t lo = hexNibble(hex[i * 2 + 1], ok);
		out._b[i] = static_cast<uint8_t>((hi << 4) | lo);
	}
	return out;
}

uint32_t ObjectId::nextCounter() {
	static std::atomic<uint32_t> seed{[] {
		std::random_device rd;
		return static_cast<uint32_t>(rd()) & 0xFFFFFFu;
	}()};
	// wrap at 24 bits
	return seed.fetch_add(1, std::memory_order_relaxed) & 0xFFFFFFu;
}
