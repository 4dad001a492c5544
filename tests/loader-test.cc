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

#include <map>
#include <set>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bulkload/file/file.h"
#include "bulkload/loader/keys.h"
#include "bulkload/loader/loader.h"
#include "bulkload/loader/output-store.h"
#include "bulkload/loader/posting.h"
#include "tests/test-util.h"

namespace bulkload {
namespace {

const char *kSchema =
    "name: string @index(term) @lang .\n"
    "age: int @index(int) .\n"
    "friend: [uid] @reverse .\n";

// Postings for a key and the store it was found in.
struct StoredKey {
  int store = -1;
  std::vector<Posting> postings;
};

class LoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    options_.schema_file = tmp_.Write("schema.txt", kSchema);
    options_.rdf_dir = tmp_.file("rdf");
    options_.out_dir = tmp_.file("out");
    options_.tmp_dir = tmp_.file("tmp");
    options_.num_workers = 2;
    options_.map_shards = 2;
    options_.reduce_shards = 2;
    options_.progress_interval = 0;
    ASSERT_TRUE(File::MakeDirectories(options_.tmp_dir));
  }

  // Run all loader stages.
  void Load() {
    Loader loader(options_, &authority_);
    loader.MapStage();
    chunks_read_ = loader.state()->progress()->chunks_read.value();
    chunks_mapped_ = loader.state()->progress()->chunks_mapped.value();
    records_ = loader.state()->progress()->records.value();
    loader.ReduceStage();
    loader.WriteSchema();
    loader.Cleanup();
  }

  // Read all output stores.
  void ReadStores() {
    for (int i = 0; i < options_.reduce_shards; ++i) {
      string dir = JoinPath(JoinPath(options_.out_dir, std::to_string(i)),
                            "p");
      uint64 version;
      ASSERT_TRUE(OutputStore::Scan(dir, [&](const Record &record) {
        EXPECT_EQ(record.version, 1);
        ParsedKey key;
        ASSERT_TRUE(ParseKey(record.key, &key));
        if (key.type == KEY_SCHEMA) {
          schema_[i].insert(record.value.str());
          return;
        }
        string k = record.key.str();
        EXPECT_EQ(keys_.count(k), 0) << "key in more than one store";
        StoredKey &stored = keys_[k];
        stored.store = i;
        ASSERT_TRUE(DecodePostingList(record.value, &stored.postings));
        predicates_[key.attr].insert(i);
      }, &version));
      EXPECT_EQ(version, 1);
    }
  }

  // Get postings for key.
  const std::vector<Posting> &Get(const string &key) {
    static const std::vector<Posting> empty;
    auto f = keys_.find(key);
    return f == keys_.end() ? empty : f->second.postings;
  }

  // Look up uid for node through the xid index.
  uint64 Uid(const string &xid) {
    const std::vector<Posting> &postings =
        Get(IndexKey("xid", string("\x02") + xid));
    EXPECT_EQ(postings.size(), 1) << xid;
    return postings.empty() ? 0 : postings[0].uid;
  }

  TempDir tmp_;
  Options options_;
  FakeAuthority authority_;
  int64 chunks_read_ = 0;
  int64 chunks_mapped_ = 0;
  int64 records_ = 0;
  std::map<string, StoredKey> keys_;
  std::map<string, std::set<int>> predicates_;
  std::map<int, std::set<string>> schema_;
};

TEST_F(LoaderTest, LoadRDF) {
  tmp_.Write("rdf/a.rdf",
             "<alice> <name> \"Alice\"@en .\n"
             "<alice> <age> \"30\" .\n"
             "<alice> <friend> <bob> .\n"
             "# comment\n"
             "<bob> <name> \"Bob\" .\n");
  tmp_.Write("rdf/b.rdf.gz",
             GZip("<carol> <friend> <alice> .\n"
                  "<carol> <name> \"Carol Ann\" .\n"));
  tmp_.Write("rdf/sub/c.rdf",
             "<bob> <age> \"25\"^^<xs:int> .\n"
             "<dave> <score> \"1.5\" .\n"
             "<dave> <friend> _:x .\n");
  tmp_.Write("rdf/ignored.json", "[]");
  options_.store_xids = true;

  Load();
  ReadStores();
  EXPECT_EQ(chunks_read_, chunks_mapped_);
  EXPECT_EQ(chunks_read_, 3);
  EXPECT_EQ(records_, 9);

  // Every predicate lives in exactly one store.
  for (auto &it : predicates_) {
    EXPECT_EQ(it.second.size(), 1) << it.first;
  }

  uint64 alice = Uid("alice");
  uint64 bob = Uid("bob");
  uint64 carol = Uid("carol");
  uint64 dave = Uid("dave");
  std::set<uint64> uids = {alice, bob, carol, dave};
  EXPECT_EQ(uids.size(), 4);
  EXPECT_EQ(uids.count(0), 0);

  // Blank nodes get uids but no xid.
  const std::vector<Posting> &dave_friends = Get(DataKey("friend", dave));
  ASSERT_EQ(dave_friends.size(), 1);
  EXPECT_EQ(uids.count(dave_friends[0].uid), 0);
  EXPECT_TRUE(Get(DataKey("xid", dave_friends[0].uid)).empty());

  const std::vector<Posting> &name = Get(DataKey("name", alice));
  ASSERT_EQ(name.size(), 1);
  EXPECT_EQ(name[0].value, "Alice");
  EXPECT_EQ(name[0].lang, "en");
  EXPECT_EQ(name[0].type, TYPE_STRING);

  const std::vector<Posting> &age = Get(DataKey("age", bob));
  ASSERT_EQ(age.size(), 1);
  EXPECT_EQ(age[0].value, "25");
  EXPECT_EQ(age[0].type, TYPE_INT);
  EXPECT_EQ(Get(DataKey("age", alice))[0].value, "30");

  const std::vector<Posting> &score = Get(DataKey("score", dave));
  ASSERT_EQ(score.size(), 1);
  EXPECT_EQ(score[0].value, "1.5");
  EXPECT_EQ(score[0].type, TYPE_DEFAULT);

  // Forward and reverse edges.
  const std::vector<Posting> &friends = Get(DataKey("friend", alice));
  ASSERT_EQ(friends.size(), 1);
  EXPECT_EQ(friends[0].uid, bob);
  EXPECT_FALSE(friends[0].is_value());
  const std::vector<Posting> &reverse = Get(ReverseKey("friend", alice));
  ASSERT_EQ(reverse.size(), 1);
  EXPECT_EQ(reverse[0].uid, carol);

  // Index terms.
  const std::vector<Posting> &ann = Get(IndexKey("name", "\x01" "ann"));
  ASSERT_EQ(ann.size(), 1);
  EXPECT_EQ(ann[0].uid, carol);
  EXPECT_EQ(Get(IndexKey("name", "\x01" "alice"))[0].uid, alice);
  EXPECT_TRUE(Get(IndexKey("name", "\x01" "comment")).empty());

  const std::vector<Posting> &xid = Get(DataKey("xid", alice));
  ASSERT_EQ(xid.size(), 1);
  EXPECT_EQ(xid[0].value, "alice");

  // The schema is written to every store, including inferred predicates.
  for (int i = 0; i < options_.reduce_shards; ++i) {
    EXPECT_EQ(schema_[i].count("name: string @index(term) @lang ."), 1);
    EXPECT_EQ(schema_[i].count("friend: [uid] @reverse ."), 1);
    EXPECT_EQ(schema_[i].count("score: default ."), 1);
    EXPECT_EQ(schema_[i].count("xid: string @index(exact) ."), 1);
  }
}

TEST_F(LoaderTest, LoadJSON) {
  options_.rdf_dir.clear();
  options_.json_dir = tmp_.file("json");
  options_.map_shards = 1;
  options_.reduce_shards = 1;
  tmp_.Write("json/people.json",
             "[\n"
             "  {\"uid\": \"_:alice\", \"name\": \"Alice\", \"age\": 30,\n"
             "   \"friend\": [{\"name\": \"Bob\"}, {\"uid\": \"0x2a\"}]},\n"
             "  {\"name\": \"Nobody\", \"note\": \"a } in text\"}\n"
             "]\n");

  Load();
  ReadStores();
  EXPECT_EQ(chunks_read_, 2);
  EXPECT_EQ(chunks_mapped_, 2);
  EXPECT_EQ(records_, 2);

  // Find Alice through the name index.
  const std::vector<Posting> &alice =
      Get(IndexKey("name", "\x01" "alice"));
  ASSERT_EQ(alice.size(), 1);
  const std::vector<Posting> &friends = Get(DataKey("friend", alice[0].uid));
  ASSERT_EQ(friends.size(), 2);

  // Postings are ordered by uid and leased uids start at 1.
  const std::vector<Posting> &bob = Get(IndexKey("name", "\x01" "bob"));
  ASSERT_EQ(bob.size(), 1);
  EXPECT_EQ(friends[0].uid, bob[0].uid);
  EXPECT_EQ(friends[1].uid, 42);
  EXPECT_EQ(Get(DataKey("age", alice[0].uid))[0].value, "30");
}

TEST_F(LoaderTest, MalformedRecords) {
  tmp_.Write("rdf/a.rdf",
             "<alice> <name> \"Alice\" .\n"
             "<alice> <age> \"thirty\" .\n"
             "<bob> <name> \"Bob\"\n"
             "<bob> <friend> \"value\" .\n");

  {
    Loader loader(options_, &authority_);
    Status st = loader.RunMapStage();
    EXPECT_FALSE(st);
    EXPECT_EQ(st.code(), EINVAL);
  }

  ASSERT_TRUE(File::DeleteRecursively(options_.tmp_dir));
  ASSERT_TRUE(File::MakeDirectories(options_.tmp_dir));
  options_.ignore_errors = true;
  Loader loader(options_, &authority_);
  ASSERT_TRUE(loader.RunMapStage());
  Progress *progress = loader.state()->progress();
  EXPECT_EQ(progress->records.value(), 1);
  EXPECT_EQ(progress->errors.value(), 3);
}

// JSON array of objects named prefix0, prefix1, ...
string NamedObjects(const string &prefix, int count) {
  string data = "[";
  for (int i = 0; i < count; ++i) {
    if (i > 0) data.append(",\n");
    data.append("{\"name\": \"" + prefix + std::to_string(i) + "\"}");
  }
  data.append("]");
  return data;
}

TEST_F(LoaderTest, MalformedJSONStopsMapStage) {
  options_.rdf_dir.clear();
  options_.json_dir = tmp_.file("json");
  options_.num_workers = 1;
  tmp_.Write("json/a0.json", "[{\"name\": \"x\"} ; {\"name\": \"y\"}]");
  for (int f = 1; f <= 5; ++f) {
    tmp_.Write("json/a" + std::to_string(f) + ".json",
               NamedObjects("n" + std::to_string(f) + "-", 200));
  }

  Loader loader(options_, &authority_);
  Status st = loader.RunMapStage();
  EXPECT_EQ(st.code(), EINVAL);
  EXPECT_TRUE(loader.state()->aborted());

  // No files are read after the failing one and the queue is drained.
  Progress *progress = loader.state()->progress();
  EXPECT_LT(progress->records.value(), 10);
  EXPECT_LT(progress->chunks_read.value(), 10);
  EXPECT_EQ(progress->chunks_read.value(), progress->chunks_mapped.value());
}

TEST_F(LoaderTest, StructuralErrorsAreFatal) {
  options_.rdf_dir.clear();
  options_.json_dir = tmp_.file("json");
  const char *inputs[] = {
    "[{\"name\": \"x\"}, {\"name\": \"y}]",
    "[{\"name\": \"x\", \"friend\": {\"name\": \"y\"}]",
    "[{\"name\": \"x\"}] trailing",
    "{\"name\": \"x\"}",
  };
  for (const char *input : inputs) {
    ASSERT_TRUE(File::DeleteRecursively(options_.tmp_dir));
    ASSERT_TRUE(File::MakeDirectories(options_.tmp_dir));
    tmp_.Write("json/data.json", input);
    tmp_.Write("json/more.json", NamedObjects("m", 50));

    Loader loader(options_, &authority_);
    Status st = loader.RunMapStage();
    EXPECT_EQ(st.code(), EINVAL) << input;
    EXPECT_TRUE(loader.state()->aborted()) << input;
    Progress *progress = loader.state()->progress();
    EXPECT_EQ(progress->chunks_read.value(), progress->chunks_mapped.value());
  }
}

TEST_F(LoaderTest, MalformedRecordStopsMapStage) {
  options_.num_workers = 1;
  tmp_.Write("rdf/a0.rdf", "<alice> <name> \"Alice\"\n");
  for (int f = 1; f <= 5; ++f) {
    string data;
    for (int i = 0; i < 200; ++i) {
      data.append("<n" + std::to_string(f * 1000 + i) + "> <name> \"x\" .\n");
    }
    tmp_.Write("rdf/a" + std::to_string(f) + ".rdf", data);
  }

  Loader loader(options_, &authority_);
  Status st = loader.RunMapStage();
  EXPECT_EQ(st.code(), EINVAL);
  EXPECT_TRUE(loader.state()->aborted());
  Progress *progress = loader.state()->progress();
  EXPECT_EQ(progress->records.value(), 0);
  EXPECT_EQ(progress->chunks_read.value(), progress->chunks_mapped.value());
}

TEST_F(LoaderTest, WorkersDrainAllFiles) {
  const int kFiles = 9;
  options_.num_workers = 3;
  for (int f = 0; f < kFiles; ++f) {
    string data;
    for (int i = 0; i < 100; ++i) {
      data.append("<n" + std::to_string(f * 100 + i) + "> <name> \"x\" .\n");
    }
    tmp_.Write("rdf/part-" + std::to_string(f) + ".rdf", data);
  }

  Loader loader(options_, &authority_);
  ASSERT_TRUE(loader.RunMapStage());
  Progress *progress = loader.state()->progress();
  EXPECT_EQ(progress->chunks_read.value(), kFiles);
  EXPECT_EQ(progress->chunks_mapped.value(), kFiles);
  EXPECT_EQ(progress->records.value(), kFiles * 100);

  // Each new node gets its own uid.
  EXPECT_GE(authority_.next_uid(), 1 + kFiles * 100);
}

TEST_F(LoaderTest, MissingInputFiles) {
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  ASSERT_TRUE(File::MakeDirectories(options_.rdf_dir));
  tmp_.Write("rdf/data.json", "[]");
  EXPECT_EXIT({
    Loader loader(options_, &authority_);
    loader.MapStage();
  }, ::testing::ExitedWithCode(1), "No \\*\\.rdf files found");
}

TEST_F(LoaderTest, MissingInputDirectory) {
  Loader loader(options_, &authority_);
  Status st = loader.RunMapStage();
  EXPECT_EQ(st.code(), ENOTDIR);
}

}  // namespace
}  // namespace bulkload
