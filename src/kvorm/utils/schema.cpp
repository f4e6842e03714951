#include "schema.h"

FieldPattern::FieldPattern(const std::string &source) : _source(source) {
	if (_source.empty()) return;
	try {
		_re = std::make_shared<const std::regex>(_source, std::regex::ECMAScript);
	} catch (const std::regex_error &) {
		_re.reset();
	}
}

bool FieldPattern::search(const std::string &text) const {
	if (!_re || text.size() > kMaxPatternSubjectLength) return false;
	return std::regex_search(text, *_re);
}

SchemaField &Schema::field(const std::string &name, FieldKind kind) {
	for (auto &f : _fields) {
		if (f.name == name) {
			f = SchemaField{};
			f.name = name;
			f.kind = kind;
			return f;
		}
	}
	SchemaField f;
	f.name = name;
	f.kind = kind;
	_fields.push_back(std::move(f));
	return _fields.back();
}

const SchemaField *Schema::find(const std::string &name) const {
	for (const auto &f : _fields) {
		if (f.name == name) return &f;
	}
	return nullptr;
}

JsonDocument Schema::describe() const {
	JsonDocument doc;
	JsonArray arr = doc.to<JsonArray>();
	for (const auto &f : _fields) {
		JsonObject o = arr.add<JsonObject>();
		o["name"] = f.name;
		o["type"] = fieldKindToString(f.kind);
		o["required"] = f.required;
		if (f.minLength) o["minLength"] = *f.minLength;
		if (f.maxLength) o["maxLength"] = *f.maxLength;
		if (!f.pattern.empty()) o["pattern"] = f.pattern.source();
		if (f.isEmail) o["email"] = true;
		if (f.isUrl) o["url"] = true;
		if (f.min) o["min"] = *f.min;
		if (f.max) o["max"] = *f.max;
		if (f.hasCustom()) o["custom"] = true;
	}
	return doc;
}
