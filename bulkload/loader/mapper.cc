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

#include "bulkload/loader/mapper.h"

#include <stdio.h>
#include <string.h>
#include <algorithm>

#include "bulkload/base/logging.h"
#include "bulkload/file/file.h"
#include "bulkload/file/recordio.h"
#include "bulkload/loader/keys.h"
#include "bulkload/loader/tokenizer.h"
#include "bulkload/util/fingerprint.h"

namespace bulkload {

// Predicate for external ids.
static const char *kXidPredicate = "xid";

Mapper::Mapper(LoaderState *state, XidMap *xids, int id)
    : state_(state),
      xids_(xids),
      shards_(state->options().map_shards),
      json_("m" + std::to_string(id) + ".") {}

Status Mapper::Run(ChunkQueue *input, InputFormat format) {
  Status status;
  string *chunk;
  while (input->Get(&chunk)) {
    // Keep draining the queue after a failure so readers are not blocked.
    if (status && !state_->aborted()) {
      status = ProcessChunk(*chunk, format);
      if (!status) state_->Abort();
    }
    delete chunk;
    state_->progress()->chunks_mapped.Increment();
  }
  if (status && !state_->aborted()) status = FlushAll();
  if (!status) state_->Abort();
  return status;
}

Status Mapper::ProcessChunk(const Slice &chunk, InputFormat format) {
  std::vector<NQuad> nquads;
  if (format == FORMAT_JSON) {
    Status st = json_.Convert(chunk, &nquads);
    if (!st) return RecordError(st);
    return ProcessRecord(nquads);
  }

  // Each line of RDF input is a record.
  const char *p = chunk.begin();
  const char *end = chunk.end();
  nquads.resize(1);
  while (p < end) {
    const char *eol = static_cast<const char *>(memchr(p, '\n', end - p));
    if (eol == nullptr) eol = end;
    Slice line(p, eol);
    p = eol + 1;

    bool empty;
    Status st = ParseRDF(line, &nquads[0], &empty);
    if (!st) {
      st = RecordError(st);
      if (!st) return st;
      continue;
    }
    if (empty) continue;
    st = ProcessRecord(nquads);
    if (!st) return st;
  }
  return Status::OK;
}

Status Mapper::ProcessRecord(const std::vector<NQuad> &nquads) {
  std::vector<Edge> edges;
  Status st = PrepareEdges(nquads, &edges);
  if (!st) return RecordError(st);
  for (const Edge &edge : edges) {
    st = EmitEdge(edge);
    if (!st) return st;
  }
  state_->progress()->records.Increment();
  return Status::OK;
}

Status Mapper::PrepareEdges(const std::vector<NQuad> &nquads,
                            std::vector<Edge> *edges) {
  edges->resize(nquads.size());
  for (int i = 0; i < nquads.size(); ++i) {
    const NQuad &nq = nquads[i];
    Edge &edge = (*edges)[i];
    edge.nquad = &nq;
    edge.schema = state_->schema()->Get(nq.predicate, !nq.has_value());
    const PredicateSchema *ps = edge.schema;

    if (!nq.has_value()) {
      if (ps->type != TYPE_UID) {
        return Status(EINVAL, "Node given for value predicate", nq.predicate);
      }
      continue;
    }

    if (ps->type == TYPE_UID) {
      return Status(EINVAL, "Value given for uid predicate", nq.predicate);
    }
    if (!nq.lang.empty() && !ps->lang && !ps->inferred) {
      return Status(EINVAL, "Language tag requires @lang for predicate",
                    nq.predicate);
    }

    // Values are stored with the schema type, or the type of the literal for
    // predicates with default type.
    Posting &value = edge.value;
    value.type = ps->type != TYPE_DEFAULT ? ps->type : nq.value_type;
    Status st = ConvertValue(value.type, nq.object_value, &value.value);
    if (!st) return st;
    value.lang = nq.lang;
    value.uid = ps->list ? Fingerprint(value.value) : ValueUid(nq.lang);

    for (const string &tokenizer : ps->tokenizers) {
      std::vector<string> terms;
      st = Tokenize(tokenizer, value.value, &terms);
      if (!st) return st;
      edge.terms.insert(edge.terms.end(), terms.begin(), terms.end());
    }
  }
  return Status::OK;
}

Status Mapper::EmitEdge(const Edge &edge) {
  const NQuad &nq = *edge.nquad;
  uint64 sid;
  Status st = LookupUid(nq.subject, &sid);
  if (!st) return st;
  int shard = state_->shards()->ShardFor(nq.predicate);

  if (!nq.has_value()) {
    // Forward and reverse uid edges.
    uint64 oid;
    st = LookupUid(nq.object_id, &oid);
    if (!st) return st;
    Posting forward;
    forward.uid = oid;
    st = AddEntry(shard, DataKey(nq.predicate, sid), forward);
    if (!st) return st;
    if (edge.schema->reverse) {
      Posting reverse;
      reverse.uid = sid;
      st = AddEntry(shard, ReverseKey(nq.predicate, oid), reverse);
      if (!st) return st;
    }
  } else {
    // Value edge and index terms.
    st = AddEntry(shard, DataKey(nq.predicate, sid), edge.value);
    if (!st) return st;
    Posting node;
    node.uid = sid;
    for (const string &term : edge.terms) {
      st = AddEntry(shard, IndexKey(nq.predicate, term), node);
      if (!st) return st;
    }
  }
  return Status::OK;
}

Status Mapper::LookupUid(const string &xid, uint64 *uid) {
  bool created;
  Status st = xids_->AssignUid(xid, uid, &created);
  if (!st) return st;
  if (!created || !state_->options().store_xids) return Status::OK;
  if (Slice(xid).starts_with("_:")) return Status::OK;

  // Store external id for new node.
  const PredicateSchema *ps = state_->schema()->Get(kXidPredicate, false);
  int shard = state_->shards()->ShardFor(kXidPredicate);
  Posting value;
  value.uid = kValueUid;
  value.type = TYPE_STRING;
  value.value = xid;
  st = AddEntry(shard, DataKey(kXidPredicate, *uid), value);
  if (!st) return st;
  Posting node;
  node.uid = *uid;
  for (const string &tokenizer : ps->tokenizers) {
    std::vector<string> terms;
    st = Tokenize(tokenizer, xid, &terms);
    if (!st) return st;
    for (const string &term : terms) {
      st = AddEntry(shard, IndexKey(kXidPredicate, term), node);
      if (!st) return st;
    }
  }
  return Status::OK;
}

Status Mapper::AddEntry(int shard, const string &key, const Posting &posting) {
  ShardBuffer &buffer = shards_[shard];
  buffer.entries.emplace_back(key, posting);
  buffer.size += buffer.entries.back().size();
  state_->progress()->map_entries.Increment();
  if (buffer.size >= state_->options().map_buf_size) return FlushShard(shard);
  return Status::OK;
}

Status Mapper::FlushShard(int shard) {
  ShardBuffer &buffer = shards_[shard];
  if (buffer.entries.empty()) return Status::OK;
  std::sort(buffer.entries.begin(), buffer.entries.end());

  string dir = state_->ShardDir(shard);
  Status st = File::MakeDirectories(dir);
  if (!st) return st;
  char name[32];
  snprintf(name, sizeof(name), "%06u.map", state_->NextMapFileId());
  string filename = JoinPath(dir, name);
  VLOG(1) << "Write " << buffer.entries.size() << " map entries to "
          << filename;

  RecordWriter *writer;
  st = RecordWriter::Open(filename, RecordFileOptions(), &writer);
  if (!st) return st;
  string value;
  for (const MapEntry &entry : buffer.entries) {
    value.clear();
    EncodePosting(entry.posting, &value);
    st = writer->Write(entry.key, value);
    if (!st) break;
  }
  Status close = writer->Close();
  delete writer;
  if (!st) return st;
  if (!close) return close;

  state_->progress()->map_files.Increment();
  buffer.entries.clear();
  buffer.entries.shrink_to_fit();
  buffer.size = 0;
  return Status::OK;
}

Status Mapper::FlushAll() {
  for (int shard = 0; shard < shards_.size(); ++shard) {
    Status st = FlushShard(shard);
    if (!st) return st;
  }
  return Status::OK;
}

Status Mapper::RecordError(const Status &error) {
  if (!state_->options().ignore_errors) return error;
  state_->progress()->errors.Increment();
  VLOG(1) << "Skipping malformed record: " << error;
  return Status::OK;
}

}  // namespace bulkload
