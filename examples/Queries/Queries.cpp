#include <kvorm/kvorm.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

static void print(const char *title, const DbResult<std::vector<JsonDocument>> &res) {
	std::printf("%s:\n", title);
	if (!res.status.ok()) {
		std::printf("  error: %s\n", res.status.message.c_str());
		return;
	}
	for (const auto &doc : res.value) {
		std::printf("  %s (%d, %s)\n",
					doc["name"].as<const char *>(),
					doc["age"].as<int>(),
					doc["role"].as<const char *>());
	}
}

int main() {
	KvOrm orm;
	OrmConfig cfg;
	cfg.logLevel = "debug";
	if (!orm.init(std::make_shared<MemoryRepository>(), cfg).ok()) return 1;

	Schema schema;
	schema.field("name", FieldKind::String).required = true;
	schema.field("age", FieldKind::Number);
	schema.field("role", FieldKind::String);
	auto people = orm.model("Person", schema);
	if (!people.status.ok()) return 1;
	Model *m = people.value;

	JsonDocument seed;
	deserializeJson(seed, R"([
		{"name":"Dana","age":30,"role":"admin"},
		{"name":"Ann","age":25,"role":"user"},
		{"name":"Carl","age":35,"role":"user"},
		{"name":"Bea","age":30,"role":"editor"},
		{"name":"Eli","age":41,"role":"user"}
	])");
	auto created = m->createMany(seed);
	std::printf("seeded %zu people\n", created.value.size());

	print("age between 28 and 40, by name",
		  m->query().filter("age", QueryOp::Gte, 28).filter("age", QueryOp::Lte, 40).sort("name").exec());

	print("oldest first, page 2 of 2",
		  m->query().sort("age", SortOrder::Desc).skip(2).limit(2).exec());

	std::vector<std::string> staff{"admin", "editor"};
	print("staff", m->query().filter("role", QueryOp::In, staff).exec());

	// Plans can also arrive as JSON
	JsonDocument wire;
	deserializeJson(wire, R"({"filters":[{"field":"name","operator":"contains","value":"a"}],"sort":{"field":"age","order":"asc"}})");
	auto plan = planFromJson(wire.as<JsonVariantConst>());
	if (plan.status.ok()) print("names containing 'a'", m->find(plan.value));

	JsonDocument patch;
	patch["role"] = "member";
	auto upd = m->updateMany(m->query().where("role", "user").plan(), patch.as<JsonObjectConst>());
	std::printf("promoted %zu users\n", upd.value);

	auto removed = m->removeMany(m->query().filter("age", QueryOp::Gt, 40).plan());
	std::printf("removed %zu, %zu left\n", removed.value, m->count().value);
	return 0;
}
