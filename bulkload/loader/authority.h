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

#ifndef BULKLOAD_LOADER_AUTHORITY_H_
#define BULKLOAD_LOADER_AUTHORITY_H_

#include <mutex>
#include <string>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/net/client.h"
#include "bulkload/util/iobuffer.h"

namespace bulkload {

// The authority hands out timestamps and uids for the cluster. Both are
// allocated in contiguous blocks and a request returns the first value of the
// block. Implementations must be thread-safe.
class Authority {
 public:
  virtual ~Authority() = default;

  // Allocate num timestamps.
  virtual Status AssignTimestamps(int num, int timeout_ms, uint64 *first) = 0;

  // Allocate num uids.
  virtual Status AssignUids(int num, int timeout_ms, uint64 *first) = 0;
};

// Client for remote authority server. Requests are sent as packets with the
// number of values as a 32-bit integer and the reply holds the first value as
// a 64-bit integer.
class AuthorityClient : public Authority, public Client {
 public:
  // Authority protocol verbs.
  enum Verb {
    AUTH_TIMESTAMPS = 1,
    AUTH_UIDS = 2,
    AUTH_RANGE = 3,
    AUTH_ERROR = 4,
  };

  // Default port for authority server.
  static const char *kDefaultPort;

  // Connect to authority at host[:port].
  Status Connect(const string &address, int timeout_ms);

  Status AssignTimestamps(int num, int timeout_ms, uint64 *first) override;
  Status AssignUids(int num, int timeout_ms, uint64 *first) override;

 private:
  // Send allocation request and parse reply. Reconnects if the connection to
  // the authority has been lost.
  Status Allocate(Verb verb, int num, int timeout_ms, uint64 *first);

  // Drop connection to authority.
  void Disconnect();

  // Server address.
  string hostname_;
  string portname_;

  // Dial timeout.
  int dial_timeout_ms_ = 0;

  // Request and response buffers.
  IOBuffer request_;
  IOBuffer response_;

  // Requests are serialized over the connection.
  std::mutex mu_;
};

// Obtain the write timestamp for the run from the authority. Failed requests
// are retried until one succeeds, waiting backoff_ms milliseconds between
// attempts.
uint64 GetWriteTimestamp(Authority *authority,
                         int backoff_ms = 1000,
                         int timeout_ms = 1000);

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_AUTHORITY_H_
