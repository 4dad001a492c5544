// Copyright 2022 Ringgaard Research ApS
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bulkload/loader/keys.h"
#include "bulkload/loader/output-store.h"
#include "bulkload/loader/schema.h"
#include "tests/test-util.h"

namespace bulkload {
namespace {

TEST(ParseSchemaTest, PredicatesAndDirectives) {
  string text =
      "# People\n"
      "name: string @index(term, exact) @lang .\n"
      "age: int @index(int) .\n"
      "friend: [uid] @reverse @count .\n"
      "<http://schema.org/url>: default.\n"
      "dgraph.type: [string] @index(exact) .\n";
  std::vector<PredicateSchema> schema;
  ASSERT_TRUE(ParseSchema(text, &schema));
  ASSERT_EQ(schema.size(), 5);

  EXPECT_EQ(schema[0].predicate, "name");
  EXPECT_EQ(schema[0].type, TYPE_STRING);
  EXPECT_EQ(schema[0].tokenizers, (std::vector<string>{"term", "exact"}));
  EXPECT_TRUE(schema[0].lang);
  EXPECT_FALSE(schema[0].list);

  EXPECT_EQ(schema[1].type, TYPE_INT);
  EXPECT_EQ(schema[1].tokenizers, std::vector<string>{"int"});

  EXPECT_EQ(schema[2].predicate, "friend");
  EXPECT_EQ(schema[2].type, TYPE_UID);
  EXPECT_TRUE(schema[2].list);
  EXPECT_TRUE(schema[2].reverse);
  EXPECT_TRUE(schema[2].count);

  EXPECT_EQ(schema[3].predicate, "http://schema.org/url");
  EXPECT_EQ(schema[3].type, TYPE_DEFAULT);

  EXPECT_EQ(schema[4].predicate, "dgraph.type");
  EXPECT_TRUE(schema[4].list);

  for (const PredicateSchema &ps : schema) EXPECT_FALSE(ps.inferred);
}

TEST(ParseSchemaTest, ToStringParsesBack) {
  string text = "friend: [uid] @reverse @count .\n"
                "name: string @index(exact, term) @lang .\n";
  std::vector<PredicateSchema> schema;
  ASSERT_TRUE(ParseSchema(text, &schema));
  EXPECT_EQ(schema[0].ToString(), "friend: [uid] @reverse @count .");
  EXPECT_EQ(schema[1].ToString(),
            "name: string @index(exact, term) @lang .");
}

TEST(ParseSchemaTest, Errors) {
  struct Case {
    const char *text;
    const char *message;
  };
  std::vector<Case> cases = {
    {"name string .", "Schema error in line 1: ':' expected after name"},
    {"a: int .\n\nname: text .", "Schema error in line 3: Unknown type"},
    {"friend: uid @index(exact) .", "Cannot index uid predicate friend"},
    {"age: int @index(term) .", "Invalid tokenizer term for age"},
    {"name: int @reverse .", "@reverse is only allowed for uid type"},
    {"name: int @lang .", "@lang is only allowed for string type"},
    {"name: string @upsert .", "Unknown directive @upsert"},
    {"name: string", "'.' expected after name"},
    {"a: int .\na: string .", "Duplicate schema for predicate a"},
    {"a: [int .", "']' expected in list type"},
  };
  for (const Case &c : cases) {
    std::vector<PredicateSchema> schema;
    Status st = ParseSchema(c.text, &schema);
    EXPECT_FALSE(st) << c.text;
    EXPECT_NE(st.message().find(c.message), string::npos)
        << c.text << ": " << st.message();
  }
}

TEST(ReadSchemaTest, CompressedSchemaFile) {
  TempDir tmp;
  string filename = tmp.Write("schema.txt.gz", GZip("name: string .\n"));
  std::vector<PredicateSchema> schema;
  ASSERT_TRUE(ReadSchema(filename, &schema));
  ASSERT_EQ(schema.size(), 1);
  EXPECT_EQ(schema[0].predicate, "name");

  EXPECT_FALSE(ReadSchema(tmp.file("missing.txt"), &schema));
}

TEST(SchemaStoreTest, InferUnknownPredicates) {
  std::vector<PredicateSchema> schema;
  ASSERT_TRUE(ParseSchema("name: string .", &schema));
  SchemaStore store(schema);
  EXPECT_EQ(store.size(), 1);
  EXPECT_EQ(store.Lookup("friend"), nullptr);

  const PredicateSchema *friends = store.Get("friend", true);
  EXPECT_EQ(friends->type, TYPE_UID);
  EXPECT_TRUE(friends->list);
  EXPECT_TRUE(friends->inferred);
  EXPECT_EQ(store.Get("friend", false), friends);

  const PredicateSchema *age = store.Get("age", false);
  EXPECT_EQ(age->type, TYPE_DEFAULT);
  EXPECT_FALSE(age->list);

  const PredicateSchema *name = store.Get("name", true);
  EXPECT_EQ(name->type, TYPE_STRING);
  EXPECT_FALSE(name->inferred);

  // Adding an existing predicate keeps the old schema.
  PredicateSchema other;
  other.predicate = "name";
  other.type = TYPE_INT;
  store.Add(other);
  EXPECT_EQ(store.Lookup("name")->type, TYPE_STRING);
  EXPECT_EQ(store.size(), 3);
}

TEST(SchemaStoreTest, WriteSchemaSegment) {
  TempDir tmp;
  std::vector<PredicateSchema> schema;
  ASSERT_TRUE(ParseSchema("name: string @index(exact) .\nage: int .",
                          &schema));
  SchemaStore store(schema);
  store.Get("friend", true);

  OutputStore *output;
  ASSERT_TRUE(OutputStore::Create(tmp.file("p"), 7, &output));
  ASSERT_TRUE(store.Write(output));
  ASSERT_TRUE(output->Close());
  delete output;

  std::vector<string> lines;
  std::vector<string> attrs;
  uint64 version = 0;
  ASSERT_TRUE(OutputStore::Scan(tmp.file("p"), [&](const Record &record) {
    ParsedKey key;
    ASSERT_TRUE(ParseKey(record.key, &key));
    EXPECT_EQ(key.type, KEY_SCHEMA);
    EXPECT_EQ(record.version, 7);
    attrs.push_back(key.attr);
    lines.push_back(record.value.str());
  }, &version));
  EXPECT_EQ(version, 7);
  EXPECT_EQ(attrs, (std::vector<string>{"age", "name", "friend"}));
  EXPECT_EQ(lines[1], "name: string @index(exact) .");
  EXPECT_EQ(lines[2], "friend: [uid] .");
}

}  // namespace
}  // namespace bulkload
