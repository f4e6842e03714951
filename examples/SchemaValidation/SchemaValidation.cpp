#include <kvorm/kvorm.h>

#include <cstdio>
#include <future>
#include <memory>
#include <set>
#include <string>

// Usernames already taken somewhere else; looked up off-thread
static std::future<bool> usernameAvailable(JsonVariantConst value) {
	std::string name = value.as<std::string>();
	return std::async(std::launch::async, [name] {
		static const std::set<std::string> taken{"root", "admin"};
		return taken.count(name) == 0;
	});
}

static void tryCreate(Model *users, const char *json) {
	JsonDocument doc;
	deserializeJson(doc, json);
	ValidationError ve;
	auto res = users->create(doc, &ve);
	if (res.status.ok()) {
		std::printf("created %s\n", res.value["_id"].as<const char *>());
	} else if (!ve.valid) {
		std::printf("rejected (%s): %s\n", validationErrorKindToString(ve.kind), ve.message.c_str());
	} else {
		std::printf("failed: %s\n", res.status.message.c_str());
	}
}

int main() {
	KvOrm orm;
	if (!orm.init(std::make_shared<MemoryRepository>()).ok()) {
		std::printf("ORM init failed\n");
		return 1;
	}

	Schema schema;
	auto &username = schema.field("username", FieldKind::String);
	username.required = true;
	username.minLength = 3;
	username.maxLength = 20;
	username.pattern = "^[a-z0-9_]+$";
	username.asyncPredicate = usernameAvailable;

	schema.field("email", FieldKind::String).isEmail = true;
	schema.field("homepage", FieldKind::String).isUrl = true;

	auto &age = schema.field("age", FieldKind::Number);
	age.min = 13;
	age.max = 120;

	schema.field("tags", FieldKind::Array);

	auto users = orm.model("User", schema);
	if (!users.status.ok()) return 1;

	tryCreate(users.value, R"({"username":"ada","email":"ada@example.com","age":36})");
	tryCreate(users.value, R"({"email":"nobody@example.com"})");
	tryCreate(users.value, R"({"username":"Bad Name"})");
	tryCreate(users.value, R"({"username":"bob","email":"not-an-email"})");
	tryCreate(users.value, R"({"username":"carl","homepage":"example.com"})");
	tryCreate(users.value, R"({"username":"dina","age":"old"})");
	tryCreate(users.value, R"({"username":"eve","age":9})");
	tryCreate(users.value, R"({"username":"admin"})");

	std::string diag;
	serializeJsonPretty(orm.getDiag(), diag);
	std::printf("%s\n", diag.c_str());
	return 0;
}
