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

#ifndef BULKLOAD_NET_CLIENT_H_
#define BULKLOAD_NET_CLIENT_H_

#include <string>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/util/iobuffer.h"

namespace bulkload {

// Simple binary packet protocol running over a HTTP socket connection. It uses
// the HTTP upgrade mechanism to switch to the binary protocol. Each packet
// starts with a small header with a 32 bit command/response verb and a 32-bit
// payload length.
class Client {
 public:
  ~Client() { Close(); }

  // Connect to server. The connect fails with ETIMEDOUT if the connection is
  // not established within timeout_ms milliseconds.
  Status Connect(const string &hostname,
                 const string &portname,
                 const string &protocol,
                 const string &agent,
                 int timeout_ms);

  // Close connection to server.
  Status Close();

  // Check if client is connected to server.
  bool connected() const { return sock_ != -1; }

 protected:
  // Packet header.
  struct Header {
    uint32 verb;   // command or reply type
    uint32 size;   // size of packet body
  };

  // Send request to server and receive reply. Fails with ETIMEDOUT if the
  // reply is not received within timeout_ms milliseconds.
  Status Perform(uint32 verb, IOBuffer *request, IOBuffer *response,
                 int timeout_ms);

  // Send request to server.
  Status Send(uint32 verb, IOBuffer *request);

  // Receive response from server.
  Status Receive(IOBuffer *response);

  // Set send and receive timeout for socket.
  Status SetTimeout(int timeout_ms);

  // Socket for connection.
  int sock_ = -1;

  // Reply verb from last request.
  uint32 reply_ = 0;
};

}  // namespace bulkload

#endif  // BULKLOAD_NET_CLIENT_H_
