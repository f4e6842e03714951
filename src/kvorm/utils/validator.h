#pragma once

#include <ArduinoJson.h>

#include <cstddef>
#include <string>

#include "schema.h"

enum class ValidationErrorKind : uint8_t {
	None = 0,
	RequiredFieldMissing,
	TypeMismatch,
	ConstraintViolation,
	CustomValidationFailed,
};

static constexpr const char *kValidationErrorKindNames[] = {
	"none",
	"required field missing",
	"type mismatch",
	"constraint violation",
	"custom validation failed"};

inline const char *validationErrorKindToString(ValidationErrorKind kind) {
	const auto idx = static_cast<uint8_t>(kind);
	const auto count = static_cast<uint8_t>(sizeof(kValidationErrorKindNames) / sizeof(kValidationErrorKindNames[0]));
	return (idx < count) ? kValidationErrorKindNames[idx] : "unknown";
}

struct ValidationError {
	bool valid = true;
	ValidationErrorKind kind = ValidationErrorKind::None;
	std::string field;
	// TypeMismatch: expected kind name. ConstraintViolation: minLength,
	// maxLength, pattern, email, url, min or max.
	std::string constraint;
	std::string bound; // bound value or pattern source
	std::string message;

	static ValidationError success() { return {}; }
};

/*
	Checks `candidate` against `schema`, walking fields in schema order and
	stopping at the first failing field. With `partial` set, required fields
	that are missing are not reported (update patches).
	Blocks on an asynchronous predicate until its future is ready.
*/
ValidationError validateDocument(const Schema &schema, JsonObjectConst candidate, bool partial);

// Checks one present, non-null value against a single field rule.
ValidationError validateValue(const SchemaField &field, JsonVariantConst value);

bool matchesKind(JsonVariantConst value, FieldKind kind);
bool isValidEmail(const std::string &s);
bool isValidUrl(const std::string &s);
// Number of code points in UTF-8 text (continuation bytes are not counted)
size_t utf8Length(const std::string &s);
