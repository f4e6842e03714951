#include "dbTest.h"

TEST(SchemaTest, FieldsKeepInsertionOrder) {
	Schema s;
	s.field("b", FieldKind::Number);
	s.field("a", FieldKind::String);
	s.field("c", FieldKind::Boolean);
	ASSERT_EQ(s.size(), 3u);
	EXPECT_EQ(s.fields()[0].name, "b");
	EXPECT_EQ(s.fields()[1].name, "a");
	EXPECT_EQ(s.fields()[2].name, "c");
}

TEST(SchemaTest, RedefiningAFieldReplacesItInPlace) {
	Schema s;
	auto &first = s.field("age", FieldKind::String);
	first.required = true;
	first.minLength = 3;
	s.field("name", FieldKind::String);

	s.field("age", FieldKind::Number);
	ASSERT_EQ(s.size(), 2u);
	const SchemaField *age = s.find("age");
	ASSERT_NE(age, nullptr);
	EXPECT_EQ(age->kind, FieldKind::Number);
	EXPECT_FALSE(age->required);
	EXPECT_FALSE(age->minLength.has_value());
	EXPECT_EQ(s.fields()[0].name, "age");
}

TEST(SchemaTest, FindUnknownFieldReturnsNull) {
	Schema s;
	s.field("name", FieldKind::String);
	EXPECT_EQ(s.find("missing"), nullptr);
}

TEST(SchemaTest, PatternIsCompiledOnAssignment) {
	SchemaField f;
	f.pattern = "^[a-z]+$";
	EXPECT_FALSE(f.pattern.empty());
	EXPECT_TRUE(f.pattern.valid());
	EXPECT_TRUE(f.pattern.search("abc"));
	EXPECT_FALSE(f.pattern.search("abc1"));
}

TEST(SchemaTest, UnanchoredPatternMatchesAnywhere) {
	FieldPattern p("[0-9]");
	EXPECT_TRUE(p.search("abc1def"));
	EXPECT_FALSE(p.search("abcdef"));
}

TEST(SchemaTest, InvalidPatternIsKeptButNotValid) {
	FieldPattern p("([a-z");
	EXPECT_FALSE(p.empty());
	EXPECT_FALSE(p.valid());
	EXPECT_EQ(p.source(), "([a-z");
	EXPECT_FALSE(p.search("abc"));
}

TEST(SchemaTest, DescribeListsConstraints) {
	Schema s;
	auto &name = s.field("name", FieldKind::String);
	name.required = true;
	name.maxLength = 10;
	name.pattern = "^A";
	auto &age = s.field("age", FieldKind::Number);
	age.min = 18;
	age.customPredicate = [](JsonVariantConst) { return true; };

	JsonDocument d = s.describe();
	ASSERT_EQ(d.size(), 2u);
	EXPECT_STREQ(d[0]["name"].as<const char *>(), "name");
	EXPECT_STREQ(d[0]["type"].as<const char *>(), "string");
	EXPECT_TRUE(d[0]["required"].as<bool>());
	EXPECT_EQ(d[0]["maxLength"].as<int>(), 10);
	EXPECT_STREQ(d[0]["pattern"].as<const char *>(), "^A");
	EXPECT_STREQ(d[1]["type"].as<const char *>(), "number");
	EXPECT_EQ(d[1]["min"].as<double>(), 18.0);
	EXPECT_TRUE(d[1]["custom"].as<bool>());
}

TEST(SchemaTest, FieldKindNames) {
	EXPECT_STREQ(fieldKindToString(FieldKind::String), "string");
	EXPECT_STREQ(fieldKindToString(FieldKind::Number), "number");
	EXPECT_STREQ(fieldKindToString(FieldKind::Boolean), "boolean");
	EXPECT_STREQ(fieldKindToString(FieldKind::Array), "array");
	EXPECT_STREQ(fieldKindToString(FieldKind::Object), "object");
}
