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
#include "bulkload/file/file.h"
#include "bulkload/file/recordio.h"
#include "bulkload/loader/output-store.h"
#include "tests/test-util.h"

namespace bulkload {
namespace {

TEST(RecordFileTest, MixedRecords) {
  TempDir tmp;
  string filename = tmp.file("test.rec");
  string large(5000, 'a');
  for (int i = 0; i < 5000; i += 7) large[i] = 'b';

  RecordFileOptions options;
  options.buffer_size = 1024;
  RecordWriter *writer;
  ASSERT_TRUE(RecordWriter::Open(filename, options, &writer));
  ASSERT_TRUE(writer->Write("k1", "small"));
  ASSERT_TRUE(writer->Write("k2", 17, large));
  ASSERT_TRUE(writer->Write("", ""));
  for (int i = 0; i < 1000; ++i) {
    ASSERT_TRUE(writer->Write("key" + std::to_string(i), i + 1,
                              "value" + std::to_string(i)));
  }
  uint64 written = writer->Tell();
  ASSERT_TRUE(writer->Close());
  delete writer;

  string contents;
  ASSERT_TRUE(File::ReadContents(filename, &contents));
  EXPECT_EQ(contents.size(), written);

  RecordReader *reader;
  ASSERT_TRUE(RecordReader::Open(filename, options, &reader));
  Record record;
  ASSERT_TRUE(reader->Read(&record));
  EXPECT_EQ(record.key.str(), "k1");
  EXPECT_EQ(record.value.str(), "small");
  EXPECT_EQ(record.version, 0);

  ASSERT_TRUE(reader->Read(&record));
  EXPECT_EQ(record.key.str(), "k2");
  EXPECT_EQ(record.version, 17);
  EXPECT_EQ(record.value.str(), large);

  ASSERT_TRUE(reader->Read(&record));
  EXPECT_TRUE(record.key.empty());
  EXPECT_TRUE(record.value.empty());

  for (int i = 0; i < 1000; ++i) {
    ASSERT_TRUE(reader->Read(&record));
    EXPECT_EQ(record.key.str(), "key" + std::to_string(i));
    EXPECT_EQ(record.version, i + 1);
    EXPECT_EQ(record.value.str(), "value" + std::to_string(i));
  }
  EXPECT_TRUE(reader->Done());
  EXPECT_EQ(reader->Tell(), written);
  EXPECT_FALSE(reader->Read(&record));
  ASSERT_TRUE(reader->Close());
  delete reader;
}

TEST(RecordFileTest, CompressLargeValues) {
  TempDir tmp;
  string filename = tmp.file("large.rec");
  string large(5000, 'a');
  RecordWriter *writer;
  ASSERT_TRUE(RecordWriter::Open(filename, RecordFileOptions(), &writer));
  ASSERT_TRUE(writer->Write("k", large));
  ASSERT_TRUE(writer->Close());
  delete writer;

  string contents;
  ASSERT_TRUE(File::ReadContents(filename, &contents));
  EXPECT_LT(contents.size(), large.size());
}

TEST(RecordFileTest, RejectsOtherFiles) {
  TempDir tmp;
  string filename = tmp.Write("bogus.rec", "this is not a record file");
  RecordReader *reader;
  Status st = RecordReader::Open(filename, RecordFileOptions(), &reader);
  EXPECT_EQ(st.code(), EBADMSG);
}

TEST(RecordFileTest, TruncatedRecord) {
  TempDir tmp;
  string filename = tmp.file("truncated.rec");
  RecordFileOptions options;
  options.compression = RecordFile::UNCOMPRESSED;
  RecordWriter *writer;
  ASSERT_TRUE(RecordWriter::Open(filename, options, &writer));
  ASSERT_TRUE(writer->Write("key", string(100, 'x')));
  ASSERT_TRUE(writer->Close());
  delete writer;

  string contents;
  ASSERT_TRUE(File::ReadContents(filename, &contents));
  contents.resize(contents.size() - 10);
  ASSERT_TRUE(File::WriteContents(filename, contents));

  RecordReader *reader;
  ASSERT_TRUE(RecordReader::Open(filename, options, &reader));
  Record record;
  EXPECT_FALSE(reader->Read(&record));
  delete reader;
}

TEST(OutputStoreTest, SegmentsAndManifest) {
  TempDir tmp;
  string dir = tmp.file("out/0/p");
  OutputStore *store;
  ASSERT_TRUE(OutputStore::Create(dir, 99, &store));

  std::vector<string> keys = {"a", "b", "c"};
  std::vector<Record> first, second;
  first.emplace_back(keys[0], "1");
  first.emplace_back(keys[1], "2");
  second.emplace_back(keys[2], "3");
  ASSERT_TRUE(store->WriteSegment(first));
  ASSERT_TRUE(store->WriteSegment(second));
  EXPECT_EQ(store->num_segments(), 2);
  ASSERT_TRUE(store->Close());
  delete store;

  string manifest;
  ASSERT_TRUE(File::ReadContents(JoinPath(dir, "MANIFEST"), &manifest));
  EXPECT_EQ(manifest,
            "version 99\nsegment 000000.seg\nsegment 000001.seg\n");

  string scanned;
  uint64 version = 0;
  ASSERT_TRUE(OutputStore::Scan(dir, [&](const Record &record) {
    EXPECT_EQ(record.version, 99);
    scanned.append(record.key.str() + "=" + record.value.str() + ";");
  }, &version));
  EXPECT_EQ(scanned, "a=1;b=2;c=3;");
  EXPECT_EQ(version, 99);

  // An existing store is never overwritten.
  Status st = OutputStore::Create(dir, 100, &store);
  EXPECT_EQ(st.code(), EEXIST);
}

}  // namespace
}  // namespace bulkload
