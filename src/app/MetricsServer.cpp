#ifdef STEWARD_HAVE_URING

#include "app/MetricsServer.hpp"
#include "util/Log.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <charconv>
#include <cstring>

namespace steward::app {

namespace {
constexpr const char* kTag = "MetricsServer";
constexpr unsigned kRingEntries = 8;
}

// CQE user data
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

MetricsServer::MetricsServer(RenderFn render, ReadyFn ready, uint16_t port)
    : render_(std::move(render)), ready_(std::move(ready)), port_(port) {}

MetricsServer::~MetricsServer() { stop(); }

void MetricsServer::start() {
  if (port_ == 0 || thread_.joinable()) return;
  if (!open_sockets()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void MetricsServer::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  uint64_t one = 1;
  if (::write(stop_eventfd_, &one, sizeof(one)) < 0)
    util::log_debug(kTag, "stop signal failed: %s", std::strerror(errno));
  thread_.join();
  close_sockets();
}

// Binding happens on the caller's thread so a busy port is reported from start().
bool MetricsServer::open_sockets() {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    util::log_error(kTag, "socket() failed: %s", std::strerror(errno));
    return false;
  }
  int reuse = 1;
  if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
    util::log_debug(kTag, "SO_REUSEADDR: %s", std::strerror(errno));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(listen_fd_, 8) < 0) {
    util::log_error(kTag, "cannot listen on 127.0.0.1:%u: %s", port_, std::strerror(errno));
    close_sockets();
    return false;
  }
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    util::log_error(kTag, "eventfd() failed: %s", std::strerror(errno));
    close_sockets();
    return false;
  }
  return true;
}

void MetricsServer::close_sockets() {
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

void MetricsServer::run(std::stop_token st) {
  io_uring ring{};
  if (int rc = io_uring_queue_init(kRingEntries, &ring, 0); rc < 0) {
    util::log_error(kTag, "io_uring_queue_init() failed: %s", std::strerror(-rc));
    return;
  }
  auto arm = [&ring](int fd, UringTag tag) {
    io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    if (!sqe) return false;
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
    return io_uring_submit(&ring) >= 0;
  };

  if (!arm(stop_eventfd_, UringTag::StopPoll) || !arm(listen_fd_, UringTag::ListenPoll)) {
    util::log_error(kTag, "cannot arm io_uring polls");
    io_uring_queue_exit(&ring);
    return;
  }
  util::log_info(kTag, "serving /metrics and /ready on 127.0.0.1:%u", port_);

  while (!st.stop_requested()) {
    io_uring_cqe* cqe = nullptr;
    int rc = io_uring_wait_cqe(&ring, &cqe);
    if (rc == -EINTR) continue;
    if (rc < 0) {
      util::log_error(kTag, "io_uring_wait_cqe() failed: %s", std::strerror(-rc));
      break;
    }
    const auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    const int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);
    if (tag == UringTag::StopPoll) break;

    if (res >= 0) {
      // Drain every pending connection; the listener is non-blocking.
      for (;;) {
        int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) break;
        handle_client(client);
        ::close(client);
      }
    }
    if (!arm(listen_fd_, UringTag::ListenPoll)) {
      util::log_error(kTag, "cannot re-arm listener poll");
      break;
    }
  }
  io_uring_queue_exit(&ring);
}

void MetricsServer::handle_client(int fd) {
  timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int nodelay = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

  char buf[2048];
  ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
  if (n <= 0) return;
  std::string_view req(buf, static_cast<size_t>(n));
  std::string_view line = req.substr(0, req.find_first_of("\r\n"));

  HttpReply r = route_request(line, render_, ready_);

  char num[24];
  std::string head = "HTTP/1.1 ";
  auto [code_end, code_ec] = std::to_chars(num, num + sizeof(num), r.code);
  head.append(num, code_end);
  head += ' ';
  head += r.reason;
  head += "\r\nContent-Type: ";
  head += r.content_type;
  head += "\r\nConnection: close\r\nContent-Length: ";
  auto [len_end, len_ec] = std::to_chars(num, num + sizeof(num), r.body.size());
  head.append(num, len_end);
  head += "\r\n\r\n";

  iovec iov[2] = {
    {.iov_base = head.data(), .iov_len = head.size()},
    {.iov_base = r.body.data(), .iov_len = r.body.size()}
  };
  msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  if (::sendmsg(fd, &msg, MSG_NOSIGNAL) < 0)
    util::log_debug(kTag, "sendmsg failed: %s", std::strerror(errno));
}

} // namespace steward::app

#endif // STEWARD_HAVE_URING
