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

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bulkload/base/clock.h"
#include "bulkload/base/logging.h"
#include "bulkload/loader/authority.h"
#include "bulkload/util/thread.h"
#include "tests/test-util.h"

namespace bulkload {
namespace {

// Authority server on a loopback port serving a fixed number of connections.
// Each connection is closed after a number of requests, or when the client
// hangs up.
class AuthorityServer {
 public:
  AuthorityServer(int connections, int requests_per_connection)
      : connections_(connections),
        requests_per_connection_(requests_per_connection),
        thread_([this]() { Serve(); }) {
    listener_ = socket(AF_INET, SOCK_STREAM, 0);
    CHECK_NE(listener_, -1);
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    CHECK_EQ(bind(listener_, reinterpret_cast<sockaddr *>(&addr),
                  sizeof(addr)), 0);
    CHECK_EQ(listen(listener_, 4), 0);
    socklen_t len = sizeof(addr);
    CHECK_EQ(getsockname(listener_, reinterpret_cast<sockaddr *>(&addr),
                         &len), 0);
    port_ = ntohs(addr.sin_port);
    thread_.SetJoinable(true);
    thread_.Start();
  }

  ~AuthorityServer() {
    thread_.Join();
    close(listener_);
  }

  string address() const { return "127.0.0.1:" + std::to_string(port_); }

  // Number of requests served.
  int requests() const { return requests_; }

 private:
  struct Header {
    uint32 verb;
    uint32 size;
  };

  static bool ReadFully(int sock, void *data, int size) {
    char *p = static_cast<char *>(data);
    while (size > 0) {
      int rc = recv(sock, p, size, 0);
      if (rc <= 0) return false;
      p += rc;
      size -= rc;
    }
    return true;
  }

  static void Reply(int sock, uint32 verb, const void *data, uint32 size) {
    Header hdr{verb, size};
    string packet(reinterpret_cast<const char *>(&hdr), sizeof(hdr));
    packet.append(static_cast<const char *>(data), size);
    CHECK_EQ(send(sock, packet.data(), packet.size(), MSG_NOSIGNAL),
             packet.size());
  }

  void Serve() {
    for (int c = 0; c < connections_; ++c) {
      int sock = accept(listener_, nullptr, nullptr);
      CHECK_NE(sock, -1);

      // Read upgrade request.
      string request;
      while (request.size() < 4 ||
             request.compare(request.size() - 4, 4, "\r\n\r\n") != 0) {
        char ch;
        if (recv(sock, &ch, 1, 0) != 1) break;
        request.push_back(ch);
      }
      EXPECT_NE(request.find("Upgrade: authority\r\n"), string::npos);
      string upgrade = "HTTP/1.1 101 Switching Protocols\r\n\r\n";
      CHECK_EQ(send(sock, upgrade.data(), upgrade.size(), MSG_NOSIGNAL),
               upgrade.size());

      // Serve requests.
      for (int r = 0; r < requests_per_connection_; ++r) {
        Header hdr;
        if (!ReadFully(sock, &hdr, sizeof(hdr))) break;
        uint32 num = 0;
        EXPECT_EQ(hdr.size, 4);
        if (!ReadFully(sock, &num, 4)) break;
        requests_++;
        if (num == 0) {
          string error = "Invalid allocation";
          Reply(sock, AuthorityClient::AUTH_ERROR, error.data(), error.size());
          continue;
        }
        uint64 *next = hdr.verb == AuthorityClient::AUTH_TIMESTAMPS
                           ? &next_ts_ : &next_uid_;
        uint64 first = *next;
        *next += num;
        Reply(sock, AuthorityClient::AUTH_RANGE, &first, 8);
      }
      close(sock);
    }
  }

  int connections_;
  int requests_per_connection_;
  int listener_;
  int port_;
  std::atomic<int> requests_{0};
  uint64 next_ts_ = 100;
  uint64 next_uid_ = 1;
  ClosureThread thread_;
};

TEST(AuthorityTest, WriteTimestampRetriesUntilSuccess) {
  FakeAuthority authority;
  authority.FailNext(2);
  uint64 ts = GetWriteTimestamp(&authority, 1000, 1000);
  EXPECT_EQ(ts, 1);

  std::vector<int64> calls = authority.timestamp_calls();
  ASSERT_EQ(calls.size(), 3);
  EXPECT_GE(calls[1] - calls[0], 1000000);
  EXPECT_GE(calls[2] - calls[1], 1000000);
}

TEST(AuthorityClientTest, AllocateRanges) {
  AuthorityServer server(1, 100);
  AuthorityClient client;
  ASSERT_TRUE(client.Connect(server.address(), 5000));

  uint64 first;
  ASSERT_TRUE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_EQ(first, 100);
  ASSERT_TRUE(client.AssignUids(10000, 1000, &first));
  EXPECT_EQ(first, 1);
  ASSERT_TRUE(client.AssignUids(5, 1000, &first));
  EXPECT_EQ(first, 10001);
  ASSERT_TRUE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_EQ(first, 101);

  // Errors reported by the authority keep the connection open.
  Status st = client.AssignUids(0, 1000, &first);
  EXPECT_EQ(st.code(), EINVAL);
  EXPECT_EQ(st.message(), "Invalid allocation");
  EXPECT_TRUE(client.connected());

  EXPECT_TRUE(client.Close());
}

TEST(AuthorityClientTest, ReconnectAfterLostConnection) {
  AuthorityServer server(2, 1);
  AuthorityClient client;
  ASSERT_TRUE(client.Connect(server.address(), 5000));

  uint64 first;
  ASSERT_TRUE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_EQ(first, 100);

  // The server hung up after the first request.
  EXPECT_FALSE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_FALSE(client.connected());

  ASSERT_TRUE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_EQ(first, 101);
  EXPECT_EQ(server.requests(), 2);
  EXPECT_TRUE(client.Close());
}

TEST(AuthorityClientTest, ReconnectBoundedByCallTimeout) {
  // The server handles one request and then stops accepting connections, so
  // reconnects hang in the protocol upgrade.
  AuthorityServer server(1, 1);
  AuthorityClient client;
  ASSERT_TRUE(client.Connect(server.address(), 60000));

  uint64 first;
  ASSERT_TRUE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_FALSE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_FALSE(client.connected());

  for (int i = 0; i < 2; ++i) {
    int64 start = Clock::micros();
    EXPECT_FALSE(client.AssignTimestamps(1, 1000, &first));
    EXPECT_LT(Clock::micros() - start, 3000000);
    EXPECT_FALSE(client.connected());
  }
}

TEST(AuthorityClientTest, ConnectionRefused) {
  // Find a free port by binding and releasing it.
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_NE(sock, -1);
  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(bind(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(getsockname(sock, reinterpret_cast<sockaddr *>(&addr), &len), 0);
  close(sock);

  AuthorityClient client;
  string address = "127.0.0.1:" + std::to_string(ntohs(addr.sin_port));
  EXPECT_FALSE(client.Connect(address, 1000));
  uint64 first;
  EXPECT_FALSE(client.AssignTimestamps(1, 1000, &first));
  EXPECT_FALSE(client.connected());
}

}  // namespace
}  // namespace bulkload
