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

#include "bulkload/loader/authority.h"

#include <unistd.h>
#include <algorithm>

#include "bulkload/base/logging.h"

namespace bulkload {

const char *AuthorityClient::kDefaultPort = "5080";

Status AuthorityClient::Connect(const string &address, int timeout_ms) {
  hostname_ = address;
  portname_ = kDefaultPort;
  int colon = address.rfind(':');
  if (colon != -1) {
    hostname_ = address.substr(0, colon);
    portname_ = address.substr(colon + 1);
  }
  if (hostname_.empty()) hostname_ = "localhost";
  dial_timeout_ms_ = timeout_ms;

  std::lock_guard<std::mutex> lock(mu_);
  return Client::Connect(hostname_, portname_, "authority", "bulkload",
                         dial_timeout_ms_);
}

Status AuthorityClient::AssignTimestamps(int num, int timeout_ms,
                                         uint64 *first) {
  return Allocate(AUTH_TIMESTAMPS, num, timeout_ms, first);
}

Status AuthorityClient::AssignUids(int num, int timeout_ms, uint64 *first) {
  return Allocate(AUTH_UIDS, num, timeout_ms, first);
}

Status AuthorityClient::Allocate(Verb verb, int num, int timeout_ms,
                                 uint64 *first) {
  std::lock_guard<std::mutex> lock(mu_);

  // Reconnect if the connection was dropped by an earlier failure.
  if (!connected()) {
    // The call timeout also bounds the time spent reconnecting.
    VLOG(1) << "Reconnect to authority " << hostname_ << ":" << portname_;
    Status st = Client::Connect(hostname_, portname_, "authority", "bulkload",
                                std::min(dial_timeout_ms_, timeout_ms));
    if (!st) {
      Disconnect();
      return st;
    }
  }

  uint32 count = num;
  request_.Clear();
  request_.Write(&count, 4);
  Status st = Perform(verb, &request_, &response_, timeout_ms);
  if (!st) {
    // The connection is in an unknown state after a failed request.
    Disconnect();
    return st;
  }

  if (reply_ == AUTH_ERROR) {
    int size = response_.available();
    return Status(EINVAL, response_.Consume(size), size);
  }
  if (reply_ != AUTH_RANGE || !response_.Read(first, 8)) {
    Disconnect();
    return Status(EBADMSG, "Invalid reply from authority");
  }
  return Status::OK;
}

void AuthorityClient::Disconnect() {
  Status st = Close();
  if (!st) VLOG(1) << "Error closing authority connection: " << st;
}

uint64 GetWriteTimestamp(Authority *authority, int backoff_ms,
                         int timeout_ms) {
  for (;;) {
    uint64 ts;
    Status st = authority->AssignTimestamps(1, timeout_ms, &ts);
    if (st) return ts;
    LOG(WARNING) << "Error communicating with authority, retrying: " << st;
    usleep(backoff_ms * 1000);
  }
}

}  // namespace bulkload
