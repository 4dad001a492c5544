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

#include "bulkload/loader/loader.h"

#include <malloc.h>
#include <stdlib.h>
#include <memory>
#include <mutex>
#include <vector>

#include "bulkload/base/logging.h"
#include "bulkload/file/file.h"
#include "bulkload/loader/input-files.h"
#include "bulkload/loader/reducer.h"
#include "bulkload/loader/schema.h"
#include "bulkload/loader/shuffler.h"
#include "bulkload/stream/buffered-input.h"
#include "bulkload/util/thread.h"
#include "bulkload/util/throttle.h"

namespace bulkload {

// Capacity of the queue between shuffler and reducer.
static const int kBatchQueueSize = 100;

Loader::Loader(const Options &options, Authority *authority)
    : authority_(authority) {
  uint64 write_ts = GetWriteTimestamp(authority);
  LOG(INFO) << "Write timestamp " << write_ts;

  std::vector<PredicateSchema> schema;
  Status st = ReadSchema(options.schema_file, &schema);
  if (!st) LOG(FATAL) << "Error reading schema " << options.schema_file
                      << ": " << st;
  SchemaStore *store = new SchemaStore(schema);
  if (options.store_xids) {
    PredicateSchema xid;
    xid.predicate = "xid";
    xid.type = TYPE_STRING;
    xid.tokenizers.push_back("exact");
    store->Add(xid);
  }

  state_ = new LoaderState(options, write_ts, store);
  state_->progress()->Start(options.progress_interval);
}

Loader::~Loader() {
  delete state_;
}

void Loader::MapStage() {
  Status st = RunMapStage();
  if (st.code() == ENODATA) {
    state_->progress()->Stop();
    LOG(ERROR) << st.message();
    exit(1);
  }
  if (!st) LOG(FATAL) << "Map stage failed: " << st;
}

void Loader::ReduceStage() {
  Status st = RunReduceStage();
  if (!st) LOG(FATAL) << "Reduce stage failed: " << st;
}

void Loader::WriteSchema() {
  for (OutputStore *store : state_->stores()) {
    Status st = state_->schema()->Write(store);
    if (!st) LOG(FATAL) << "Error writing schema to " << store->dir() << ": "
                        << st;
  }
}

void Loader::Cleanup() {
  for (OutputStore *store : state_->stores()) {
    Status st = store->Close();
    if (!st) LOG(FATAL) << "Error closing " << store->dir() << ": " << st;
  }
  state_->progress()->EndSummary();
}

Status Loader::RunMapStage() {
  state_->progress()->SetPhase(Progress::PHASE_MAP);

  // Create fresh xid store in the temp directory.
  XidStore *store;
  Status st = XidStore::Open(JoinPath(state_->options().tmp_dir, "xids"),
                             &store);
  if (!st) return st;
  XidMap *xids = new XidMap(store, authority_, XidMapOptions());

  st = RunMappers(xids);

  // Release the xid map and return the memory to the system before the
  // reduce stage.
  xids->EvictAll();
  delete xids;
  Status close = store->Close();
  delete store;
  malloc_trim(0);

  if (!st) return st;
  return close;
}

Status Loader::RunMappers(XidMap *xids) {
  const Options &options = state_->options();
  InputFormat format = options.format();
  string ext = InputFormatExtension(format);

  // Find input files.
  std::vector<string> files;
  Status st = FindDataFiles(options.input_dir(), ext, &files);
  if (!st) return st;
  if (files.empty()) return Status(ENODATA, "No *" + ext + " files found.");

  // Start mappers. The mappers run until the chunk queue is closed.
  ChunkQueue queue(options.num_workers);
  std::vector<std::unique_ptr<Mapper>> mappers;
  std::vector<Status> mapper_status(options.num_workers);
  std::vector<ClosureThread> workers;
  workers.reserve(options.num_workers);
  for (int i = 0; i < options.num_workers; ++i) {
    mappers.emplace_back(new Mapper(state_, xids, i));
    Mapper *mapper = mappers.back().get();
    Status *result = &mapper_status[i];
    workers.emplace_back([mapper, result, &queue, format]() {
      *result = mapper->Run(&queue, format);
    });
    workers.back().SetJoinable(true);
    workers.back().Start();
  }

  // Read input files, throttling the number of concurrent readers.
  Throttle throttle(options.num_workers);
  std::mutex mu;
  Status reader_status;
  std::vector<ClosureThread> readers;
  readers.reserve(files.size());
  for (int i = 0; i < files.size(); ++i) {
    // Stop starting new readers once the stage has failed.
    if (state_->aborted()) break;
    throttle.Start();
    if (state_->aborted()) {
      throttle.Done();
      break;
    }
    const string &filename = files[i];
    LOG(INFO) << "Processing file (" << (i + 1) << " out of " << files.size()
              << "): " << filename;
    readers.emplace_back([this, &filename, format, &queue, &throttle, &mu,
                          &reader_status]() {
      Status st = ReadFile(filename, format, &queue);
      if (!st) {
        state_->Abort();
        std::lock_guard<std::mutex> lock(mu);
        if (reader_status) {
          reader_status = Status(st.code(), "Error reading " + filename +
                                            ": " + st.message());
        }
      }
      throttle.Done();
    });
    readers.back().SetJoinable(true);
    readers.back().Start();
  }
  throttle.Wait();
  for (ClosureThread &reader : readers) reader.Join();

  // Closing the queue lets the mappers finish.
  queue.Close();
  for (ClosureThread &worker : workers) worker.Join();
  mappers.clear();

  if (!reader_status) return reader_status;
  for (const Status &result : mapper_status) {
    if (!result) return result;
  }
  return Status::OK;
}

Status Loader::ReadFile(const string &filename, InputFormat format,
                        ChunkQueue *queue) {
  InputStream *stream;
  Status st = OpenInputStream(filename, &stream);
  if (!st) return st;
  std::unique_ptr<InputStream> owned_stream(stream);
  std::unique_ptr<Chunker> chunker(Chunker::Create(format));
  BufferedInput input(stream);

  st = chunker->Begin(&input);
  if (!st) return st;
  for (;;) {
    // Another reader or mapper has failed.
    if (state_->aborted()) return Status::OK;
    string *chunk = new string();
    bool eof;
    st = chunker->Chunk(&input, chunk, &eof);
    if (!st) {
      delete chunk;
      return st;
    }
    if (chunk->empty()) {
      delete chunk;
    } else {
      state_->progress()->chunks_read.Increment();
      queue->Put(chunk);
    }
    if (eof) break;
  }
  return chunker->End(&input);
}

Status Loader::RunReduceStage() {
  state_->progress()->SetPhase(Progress::PHASE_REDUCE);
  const Options &options = state_->options();

  // Create output store for each reduce shard.
  for (int shard = 0; shard < options.reduce_shards; ++shard) {
    OutputStore *store;
    Status st = OutputStore::Create(state_->StoreDir(shard),
                                    state_->write_ts(), &store);
    if (!st) return st;
    state_->AddStore(store);
  }

  // Run shuffler in the background and reduce its output.
  BatchQueue queue(kBatchQueueSize);
  Shuffler shuffler(state_, &queue);
  Status shuffle_status;
  ClosureThread shuffle([&shuffler, &shuffle_status]() {
    shuffle_status = shuffler.Run();
  });
  shuffle.SetJoinable(true);
  shuffle.Start();

  Reducer reducer(state_, &queue);
  Status st = reducer.Run();
  shuffle.Join();

  if (!shuffle_status) return shuffle_status;
  return st;
}

}  // namespace bulkload
