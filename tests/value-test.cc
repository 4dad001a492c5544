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

#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bulkload/loader/keys.h"
#include "bulkload/loader/posting.h"
#include "bulkload/loader/tokenizer.h"
#include "bulkload/loader/value.h"
#include "bulkload/util/fingerprint.h"

namespace bulkload {
namespace {

TEST(ValueTest, TypeNames) {
  for (int i = TYPE_DEFAULT; i <= TYPE_UID; ++i) {
    ValueType type;
    ASSERT_TRUE(ParseValueType(ValueTypeName(static_cast<ValueType>(i)),
                               &type));
    EXPECT_EQ(type, i);
  }
  ValueType type;
  EXPECT_FALSE(ParseValueType("text", &type));

  EXPECT_EQ(DatatypeValueType("xs:int"), TYPE_INT);
  EXPECT_EQ(DatatypeValueType("xs:boolean"), TYPE_BOOL);
  EXPECT_EQ(DatatypeValueType("double"), TYPE_FLOAT);
  EXPECT_EQ(DatatypeValueType("xs:dateTime"), TYPE_DATETIME);
  EXPECT_EQ(DatatypeValueType("xs:string"), TYPE_STRING);
  EXPECT_EQ(DatatypeValueType("http://example.com/unknown"), TYPE_DEFAULT);
}

TEST(ValueTest, ConvertValues) {
  string value;
  ASSERT_TRUE(ConvertValue(TYPE_INT, "-0042", &value));
  EXPECT_EQ(value, "-42");
  ASSERT_TRUE(ConvertValue(TYPE_FLOAT, "1.5", &value));
  EXPECT_EQ(value, "1.5");
  ASSERT_TRUE(ConvertValue(TYPE_FLOAT, "2e3", &value));
  EXPECT_EQ(value, "2000");
  ASSERT_TRUE(ConvertValue(TYPE_BOOL, "1", &value));
  EXPECT_EQ(value, "true");
  ASSERT_TRUE(ConvertValue(TYPE_BOOL, "false", &value));
  EXPECT_EQ(value, "false");
  ASSERT_TRUE(ConvertValue(TYPE_DATETIME, "2021-03-04T05:06:07Z", &value));
  EXPECT_EQ(value, "2021-03-04T05:06:07Z");
  ASSERT_TRUE(ConvertValue(TYPE_DEFAULT, "anything", &value));
  EXPECT_EQ(value, "anything");

  EXPECT_FALSE(ConvertValue(TYPE_INT, "12abc", &value));
  EXPECT_FALSE(ConvertValue(TYPE_INT, "", &value));
  EXPECT_FALSE(ConvertValue(TYPE_INT, "99999999999999999999", &value));
  EXPECT_FALSE(ConvertValue(TYPE_FLOAT, "one", &value));
  EXPECT_FALSE(ConvertValue(TYPE_BOOL, "yes", &value));
  EXPECT_FALSE(ConvertValue(TYPE_DATETIME, "yesterday", &value));
  EXPECT_FALSE(ConvertValue(TYPE_UID, "0x1", &value));
}

TEST(TokenizerTest, ValidTokenizers) {
  EXPECT_TRUE(ValidTokenizer("exact", TYPE_INT));
  EXPECT_TRUE(ValidTokenizer("exact", TYPE_STRING));
  EXPECT_FALSE(ValidTokenizer("exact", TYPE_UID));
  EXPECT_TRUE(ValidTokenizer("term", TYPE_STRING));
  EXPECT_TRUE(ValidTokenizer("term", TYPE_DEFAULT));
  EXPECT_FALSE(ValidTokenizer("term", TYPE_INT));
  EXPECT_TRUE(ValidTokenizer("int", TYPE_INT));
  EXPECT_FALSE(ValidTokenizer("int", TYPE_FLOAT));
  EXPECT_FALSE(ValidTokenizer("fulltext", TYPE_STRING));
}

TEST(TokenizerTest, TermsAreLowercasedAndUnique) {
  std::vector<string> terms;
  ASSERT_TRUE(Tokenize("term", "The quick, the QUICK fox!", &terms));
  std::vector<string> expected = {"\x01" "fox", "\x01" "quick", "\x01" "the"};
  EXPECT_EQ(terms, expected);

  ASSERT_TRUE(Tokenize("exact", "The Fox", &terms));
  EXPECT_EQ(terms, std::vector<string>{"\x02" "The Fox"});

  ASSERT_TRUE(Tokenize("term", " ,. ", &terms));
  EXPECT_TRUE(terms.empty());

  EXPECT_FALSE(Tokenize("int", "abc", &terms));
  EXPECT_FALSE(Tokenize("bogus", "abc", &terms));
}

TEST(TokenizerTest, IntTermsSortNumerically) {
  std::vector<int64> numbers = {-1000, -1, 0, 1, 255, 256, 1000000};
  std::vector<string> keys;
  for (int64 n : numbers) {
    std::vector<string> terms;
    ASSERT_TRUE(Tokenize("int", std::to_string(n), &terms));
    ASSERT_EQ(terms.size(), 1);
    EXPECT_EQ(terms[0].size(), 9);
    keys.push_back(terms[0]);
  }
  EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));
}

TEST(KeysTest, ParseKeys) {
  ParsedKey key;
  ASSERT_TRUE(ParseKey(DataKey("name", 0x0102), &key));
  EXPECT_EQ(key.type, KEY_DATA);
  EXPECT_EQ(key.attr, "name");
  EXPECT_EQ(key.uid, 0x0102);

  ASSERT_TRUE(ParseKey(ReverseKey("friend", 7), &key));
  EXPECT_EQ(key.type, KEY_REVERSE);
  EXPECT_EQ(key.attr, "friend");
  EXPECT_EQ(key.uid, 7);

  ASSERT_TRUE(ParseKey(IndexKey("name", "\x01" "fox"), &key));
  EXPECT_EQ(key.type, KEY_INDEX);
  EXPECT_EQ(key.term, "\x01" "fox");

  ASSERT_TRUE(ParseKey(SchemaKey("name"), &key));
  EXPECT_EQ(key.type, KEY_SCHEMA);
  EXPECT_EQ(key.attr, "name");

  string truncated = DataKey("name", 1);
  truncated.resize(truncated.size() - 1);
  EXPECT_FALSE(ParseKey(truncated, &key));
  EXPECT_FALSE(ParseKey(string("\x09\x00\x00", 3), &key));
}

TEST(KeysTest, DataKeysSortByUid) {
  EXPECT_LT(DataKey("a", 1), DataKey("a", 2));
  EXPECT_LT(DataKey("a", 255), DataKey("a", 256));
  EXPECT_LT(DataKey("b", 1), DataKey("aa", 1));
  EXPECT_LT(DataKey("z", 100), SchemaKey("a"));
}

TEST(PostingTest, EncodePostingList) {
  std::vector<Posting> postings(3);
  postings[0].uid = 42;
  postings[1].uid = ValueUid("en");
  postings[1].type = TYPE_STRING;
  postings[1].value = "hello";
  postings[1].lang = "en";
  postings[2].uid = kValueUid;
  postings[2].type = TYPE_INT;
  postings[2].value = "7";

  string buffer;
  EncodePostingList(postings, &buffer);
  std::vector<Posting> decoded;
  ASSERT_TRUE(DecodePostingList(buffer, &decoded));
  ASSERT_EQ(decoded.size(), 3);
  EXPECT_FALSE(decoded[0].is_value());
  EXPECT_EQ(decoded[0].uid, 42);
  EXPECT_EQ(decoded[1].uid, Fingerprint("en"));
  EXPECT_EQ(decoded[1].lang, "en");
  EXPECT_EQ(decoded[1].value, "hello");
  EXPECT_EQ(decoded[2].type, TYPE_INT);
  EXPECT_EQ(decoded[2].uid, kValueUid);

  buffer.resize(buffer.size() - 1);
  EXPECT_FALSE(DecodePostingList(buffer, &decoded));
}

TEST(PostingTest, MapEntryOrder) {
  Posting p1, p2;
  p1.uid = 5;
  p2.uid = 3;
  MapEntry a(DataKey("a", 1), p1);
  MapEntry b(DataKey("a", 1), p2);
  MapEntry c(DataKey("a", 0), p1);
  EXPECT_TRUE(b < a);
  EXPECT_TRUE(c < b);
  EXPECT_FALSE(a < a);
}

}  // namespace
}  // namespace bulkload
