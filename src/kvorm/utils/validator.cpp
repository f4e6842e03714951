#include "validator.h"

#include <cctype>
#include <cstdio>

namespace {
std::string formatNumber(double v) {
	char buf[32];
	snprintf(buf, sizeof(buf), "%.15g", v);
	return buf;
}

ValidationError fail(ValidationErrorKind kind,
					 const std::string &field,
					 const std::string &constraint,
					 const std::string &bound,
					 const std::string &reason) {
	ValidationError e;
	e.valid = false;
	e.kind = kind;
	e.field = field;
	e.constraint = constraint;
	e.bound = bound;
	e.message = "Field '" + field + "' " + reason;
	return e;
}

ValidationError checkString(const SchemaField &f, const std::string &s) {
	const size_t len = utf8Length(s);
	if (f.minLength && len < *f.minLength) {
		const auto n = std::to_string(*f.minLength);
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "minLength", n, "must be at least " + n + " characters");
	}
	if (f.maxLength && len > *f.maxLength) {
		const auto n = std::to_string(*f.maxLength);
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "maxLength", n, "must be at most " + n + " characters");
	}
	if (!f.pattern.empty() && !f.pattern.valid()) {
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "pattern", f.pattern.source(), "has an invalid pattern");
	}
	if (!f.pattern.empty() && s.size() > kMaxPatternSubjectLength) {
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "pattern", f.pattern.source(), "is too long to match pattern");
	}
	if (!f.pattern.empty() && !f.pattern.search(s)) {
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "pattern", f.pattern.source(), "does not match pattern");
	}
	if (f.isEmail && !isValidEmail(s)) {
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "email", "", "must be a valid email");
	}
	if (f.isUrl && !isValidUrl(s)) {
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "url", "", "must be a valid URL");
	}
	return ValidationError::success();
}

ValidationError checkNumber(const SchemaField &f, double v) {
	if (f.min && v < *f.min) {
		const auto n = formatNumber(*f.min);
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "min", n, "must be at least " + n);
	}
	if (f.max && v > *f.max) {
		const auto n = formatNumber(*f.max);
		return fail(ValidationErrorKind::ConstraintViolation, f.name, "max", n, "must be at most " + n);
	}
	return ValidationError::success();
}

// Any exception out of a predicate, sync or async, is a failed check.
bool runCustom(const SchemaField &f, JsonVariantConst value) {
	try {
		if (f.customPredicate && !f.customPredicate(value)) return false;
		if (f.asyncPredicate) {
			std::future<bool> fut = f.asyncPredicate(value);
			if (!fut.valid()) return false;
			return fut.get();
		}
	} catch (...) {
		return false;
	}
	return true;
}
} // namespace

bool matchesKind(JsonVariantConst value, FieldKind kind) {
	switch (kind) {
	case FieldKind::String:
		return value.is<const char *>();
	case FieldKind::Number:
		return value.is<double>() && !value.is<bool>();
	case FieldKind::Boolean:
		return value.is<bool>();
	case FieldKind::Array:
		return value.is<JsonArrayConst>();
	case FieldKind::Object:
		return value.is<JsonObjectConst>();
	}
	return false;
}

bool isValidEmail(const std::string &s) {
	size_t at = std::string::npos;
	for (size_t i = 0; i < s.size(); ++i) {
		const unsigned char c = static_cast<unsigned char>(s[i]);
		if (std::isspace(c)) return false;
		if (c != '@') continue;
		if (at != std::string::npos) return false;
		at = i;
	}
	if (at == std::string::npos || at == 0) return false;
	// domain needs a '.' with text on both sides
	for (size_t i = at + 2; i + 1 < s.size(); ++i) {
		if (s[i] == '.') return true;
	}
	return false;
}

bool isValidUrl(const std::string &s) {
	if (s.empty()) return false;
	for (unsigned char c : s) {
		if (std::isspace(c) || std::iscntrl(c)) return false;
	}
	// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
	if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
	size_t i = 1;
	while (i < s.size()) {
		const unsigned char c = static_cast<unsigned char>(s[i]);
		if (std::isalnum(c) || c == '+' || c == '-' || c == '.') {
			++i;
			continue;
		}
		break;
	}
	if (i >= s.size() || s[i] != ':') return false;
	const std::string rest = s.substr(i + 1);
	if (rest.empty()) return false;
	if (rest.compare(0, 2, "//") == 0) {
		const size_t end = rest.find_first_of("/?#", 2);
		const std::string authority = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
		if (authority.empty()) return false;
	}
	return true;
}

size_t utf8Length(const std::string &s) {
	size_t n = 0;
	for (unsigned char c : s) {
		if ((c & 0xC0) != 0x80) ++n;
	}
	return n;
}

ValidationError validateValue(const SchemaField &f, JsonVariantConst value) {
	if (!matchesKind(value, f.kind)) {
		const char *kindName = fieldKindToString(f.kind);
		return fail(ValidationErrorKind::TypeMismatch, f.name, kindName, "", std::string("must be of type ") + kindName);
	}
	ValidationError e;
	if (f.kind == FieldKind::String) {
		JsonString str = value.as<JsonString>();
		e = checkString(f, std::string(str.c_str(), str.size()));
	} else if (f.kind == FieldKind::Number) {
		e = checkNumber(f, value.as<double>());
	}
	if (!e.valid) return e;
	if (f.hasCustom() && !runCustom(f, value)) {
		return fail(ValidationErrorKind::CustomValidationFailed, f.name, "", "", "failed custom validation");
	}
	return ValidationError::success();
}

ValidationError validateDocument(const Schema &schema, JsonObjectConst candidate, bool partial) {
	for (const auto &f : schema.fields()) {
		JsonVariantConst v = candidate[f.name];
		if (v.isNull()) {
			if (f.required && !partial) {
				return fail(ValidationErrorKind::RequiredFieldMissing, f.name, "required", "", "is required");
			}
			continue;
		}
		auto e = validateValue(f, v);
		if (!e.valid) return e;
	}
	return ValidationError::success();
}
