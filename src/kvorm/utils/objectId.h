#pragma once

#include <array>
#include <cstdint>
#include <string>

/*
	ObjectId-style IDs (12-byte → 24-hex)
	Layout: 4 bytes seconds since epoch, 5 bytes process random, 3 bytes counter.
*/
class ObjectId {
  public:
	ObjectId(); // fills from wall clock + process random + counter
	std::string toHex() const;
	uint32_t seconds() const;
	static ObjectId fromHex(const std::string &hex, bool *ok);

  private:
	std::array<uint8_t, 12> _b{};
	static uint32_t nextCounter();
};
