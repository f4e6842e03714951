#pragma once

#include <ArduinoJson.h>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

using CustomPredicateFn = std::function<bool(JsonVariantConst)>;
using AsyncPredicateFn = std::function<std::future<bool>(JsonVariantConst)>;

enum class FieldKind : uint8_t {
	String = 0,
	Number,
	Boolean,
	Array,
	Object,
};

static constexpr const char *kFieldKindNames[] = {"string", "number", "boolean", "array", "object"};

inline const char *fieldKindToString(FieldKind kind) {
	const auto idx = static_cast<uint8_t>(kind);
	const auto count = static_cast<uint8_t>(sizeof(kFieldKindNames) / sizeof(kFieldKindNames[0]));
	return (idx < count) ? kFieldKindNames[idx] : "unknown";
}

// Longest string a pattern is matched against. std::regex recurses per
// character, so longer input is reported as a pattern violation.
static constexpr size_t kMaxPatternSubjectLength = 4096;

// Regular expression compiled once at assignment.
// An empty source means "no pattern"; a source that fails to compile is kept
// with valid() == false so validation can report it.
class FieldPattern {
  public:
	FieldPattern() = default;
	FieldPattern(const char *source) : FieldPattern(std::string(source ? source : "")) {}
	FieldPattern(const std::string &source);

	bool empty() const { return _source.empty(); }
	bool valid() const { return _re != nullptr; }
	const std::string &source() const { return _source; }
	bool search(const std::string &text) const;

  private:
	std::string _source;
	std::shared_ptr<const std::regex> _re;
};

struct SchemaField {
	std::string name;
	FieldKind kind = FieldKind::String;
	bool required = false;
	// String only
	std::optional<size_t> minLength;
	std::optional<size_t> maxLength;
	FieldPattern pattern;
	bool isEmail = false;
	bool isUrl = false;
	// Number only
	std::optional<double> min;
	std::optional<double> max;
	// Run after every built-in check passed
	CustomPredicateFn customPredicate{};
	AsyncPredicateFn asyncPredicate{};

	bool hasCustom() const { return customPredicate != nullptr || asyncPredicate != nullptr; }
};

class Schema {
  public:
	Schema() = default;

	// Add a field, or reset an existing one of the same name in place.
	// Returns the field so its constraints can be set; the reference is
	// valid until the next call to field().
	SchemaField &field(const std::string &name, FieldKind kind);

	const SchemaField *find(const std::string &name) const;
	const std::vector<SchemaField> &fields() const { return _fields; }
	bool empty() const { return _fields.empty(); }
	size_t size() const { return _fields.size(); }

	// Field descriptions (predicates are reported as flags only)
	JsonDocument describe() const;

  private:
	std::vector<SchemaField> _fields;
};
