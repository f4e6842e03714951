#include <kvorm/kvorm.h>

#include <cstdio>
#include <memory>

int main() {
	KvOrm orm;

	OrmConfig cfg;
	cfg.storeNamespace = "example";

	auto repo = std::make_shared<FsRepository>("example_db");
	if (!repo->init().ok() || !orm.init(repo, cfg).ok()) {
		std::printf("ORM init failed\n");
		return 1;
	}

	orm.onEvent([](DBEventType event) {
		std::printf("Event: %s\n", dbEventTypeToString(event));
	});

	orm.onError([](const DbStatus &status) {
		std::printf("Error: %s\n", status.message.c_str());
	});

	Schema userSchema;
	userSchema.field("username", FieldKind::String).required = true;
	userSchema.field("email", FieldKind::String).isEmail = true;
	auto users = orm.model("User", userSchema);
	if (!users.status.ok()) return 1;

	JsonDocument userDoc;
	userDoc["email"] = "kvorm@example.com";
	userDoc["username"] = "kvorm";
	auto createRes = users.value->create(userDoc);
	if (createRes.status.ok()) {
		const std::string id = createRes.value["_id"].as<std::string>();
		std::printf("Created user %s\n", id.c_str());
		users.value->removeById(id);
	}
	return 0;
}
