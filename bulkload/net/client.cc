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

#include "bulkload/net/client.h"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/uio.h>

namespace bulkload {

// Return system error. Socket timeouts are reported as ETIMEDOUT.
static Status Error(const char *context) {
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK) err = ETIMEDOUT;
  return Status(err, context, strerror(err));
}

// Connect socket to address within timeout.
static int ConnectWithTimeout(int sock, const struct sockaddr *addr,
                              socklen_t addrlen, int timeout_ms) {
  int flags = fcntl(sock, F_GETFL, 0);
  if (flags == -1) return errno;
  if (fcntl(sock, F_SETFL, flags | O_NONBLOCK) == -1) return errno;

  int err = 0;
  if (connect(sock, addr, addrlen) != 0) {
    if (errno != EINPROGRESS) return errno;
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;
    int rc = poll(&pfd, 1, timeout_ms);
    if (rc < 0) return errno;
    if (rc == 0) return ETIMEDOUT;
    socklen_t len = sizeof(err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len) != 0) return errno;
    if (err != 0) return err;
  }

  if (fcntl(sock, F_SETFL, flags) == -1) return errno;
  return 0;
}

Status Client::Connect(const string &hostname,
                       const string &portname,
                       const string &protocol,
                       const string &agent,
                       int timeout_ms) {
  // Close existing connection.
  if (sock_ != -1) {
    close(sock_);
    sock_ = -1;
  }

  // Look up server address and connect.
  struct addrinfo hints = {}, *addrs;
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  int err = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &addrs);
  if (err != 0) return Status(EHOSTUNREACH, gai_strerror(err), hostname);

  for (struct addrinfo *addr = addrs; addr != nullptr; addr = addr->ai_next) {
    // Create socket.
    sock_ = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (sock_ == -1) {
      err = errno;
      break;
    }

    // Connect socket.
    err = ConnectWithTimeout(sock_, addr->ai_addr, addr->ai_addrlen,
                             timeout_ms);
    if (err == 0) break;
    close(sock_);
    sock_ = -1;
  }
  freeaddrinfo(addrs);
  if (sock_ == -1) return Status(err, strerror(err), hostname);

  // Upgrade connection.
  Status st = SetTimeout(timeout_ms);
  if (!st) return st;
  string request =  "GET / HTTP/1.1\r\n"
    "Host: " + hostname + "\r\n"
    "User-Agent: " + agent + "\r\n"
    "Connection: upgrade\r\n"
    "Upgrade: " + protocol + "\r\n"
    "\r\n";
  int rc = send(sock_, request.data(), request.size(), MSG_NOSIGNAL);
  if (rc < 0) return Error("send");
  if (rc != request.size()) {
    return Status(EBADE, "Upgrade failed in send");
  }

  IOBuffer response;
  while (response.available() < 12 ||
         memcmp(response.end() - 4, "\r\n\r\n", 4) != 0) {
    response.Ensure(256);
    int rc = recv(sock_, response.end(), response.remaining(), 0);
    if (rc < 0) return Error("recv");
    if (rc == 0) return Status(EBADE, "Upgrade failed in recv");
    response.Append(rc);
  }
  if (!response.data().starts_with("HTTP/1.1 101")) {
    return Status(EBADE, "Upgrade failed");
  }

  return Status::OK;
}

Status Client::Close() {
  if (sock_ != -1) {
    if (close(sock_) != 0) {
      sock_ = -1;
      return Error("close");
    }
    sock_ = -1;
  }
  return Status::OK;
}

Status Client::SetTimeout(int timeout_ms) {
  struct timeval tv;
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    return Error("setsockopt");
  }
  if (setsockopt(sock_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
    return Error("setsockopt");
  }
  return Status::OK;
}

Status Client::Perform(uint32 verb, IOBuffer *request, IOBuffer *response,
                       int timeout_ms) {
  if (sock_ == -1) return Status(EPIPE, "Not connected");
  Status st = SetTimeout(timeout_ms);
  if (!st) return st;

  // Send request.
  st = Send(verb, request);
  if (!st) return st;

  // Receive response.
  return Receive(response);
}

Status Client::Send(uint32 verb, IOBuffer *request) {
  Header hdr;
  hdr.verb = verb;
  hdr.size = request->available();

  size_t reqsize = request->available();
  size_t bufsize = sizeof(Header) + reqsize;
  iovec buf[2];
  buf[0].iov_base = &hdr;
  buf[0].iov_len = sizeof(Header);
  buf[1].iov_base = request->Consume(reqsize);
  buf[1].iov_len = reqsize;

  struct msghdr msg = {};
  msg.msg_iov = buf;
  msg.msg_iovlen = 2;
  int rc = sendmsg(sock_, &msg, MSG_NOSIGNAL);
  if (rc == 0) return Status(EPIPE, "Connection closed");
  if (rc < 0) return Error("send");
  if (rc != bufsize) return Status(EMSGSIZE, "Send truncated");

  return Status::OK;
}

Status Client::Receive(IOBuffer *response) {
  Header hdr;
  char *data = reinterpret_cast<char *>(&hdr);
  int left = sizeof(Header);
  while (left > 0) {
    int rc = recv(sock_, data, left, 0);
    if (rc == 0) return Status(EPIPE, "Connection closed");
    if (rc < 0) return Error("recv");
    data += rc;
    left -= rc;
  }
  reply_ = hdr.verb;

  response->Clear();
  response->Ensure(hdr.size);
  left = hdr.size;
  while (left > 0) {
    int rc = recv(sock_, response->end(), left, 0);
    if (rc == 0) return Status(EPIPE, "Connection closed");
    if (rc < 0) return Error("recv");
    response->Append(rc);
    left -= rc;
  }

  return Status::OK;
}

}  // namespace bulkload
