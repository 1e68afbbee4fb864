#include "server/server.hpp"
#include "test_support.hpp"
#include <atomic>
#include <future>
#include <sys/resource.h>

// Runs Server::serve() on its own thread against a fresh port.
struct ServingThread {
  Server svr;
  int port;
  bool bound = false;
  std::future<void> done;

  explicit ServingThread(const fs::path &root) : svr(root), port(free_port()) {
    bound = svr.bind("127.0.0.1", port);
    if (bound) {
      done = std::async(std::launch::async, [this]() { svr.serve(); });
    }
  }

  ~ServingThread() {
    svr.stop();
    if (done.valid()) {
      done.wait();
    }
  }

  void stop() { svr.stop(); }

  bool returned_within(std::chrono::milliseconds limit) {
    return done.wait_for(limit) == std::future_status::ready;
  }
};

static int connect_raw(int port) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  if (connect(fd, (sockaddr *)&addr, sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

static void send_text(int fd, const std::string &text) {
  send(fd, text.data(), text.size(), MSG_NOSIGNAL);
}

static std::string read_to_eof(int fd) {
  std::string data;
  char buffer[65536];
  for (;;) {
    ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    data.append(buffer, static_cast<size_t>(n));
  }
  return data;
}

static double cpu_seconds() {
  rusage usage{};
  getrusage(RUSAGE_SELF, &usage);
  return usage.ru_utime.tv_sec + usage.ru_stime.tv_sec +
         (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
}

static void test_trickling_client_does_not_hold_stop() {
  TempDir site("conn-trickle");
  site.write("index.html", "x\n");
  ServingThread serving(site.path);
  check(serving.bound, "trickle server bound");
  if (!serving.bound) {
    return;
  }

  int client = connect_raw(serving.port);
  check(client >= 0, "trickling client connected");
  if (client < 0) {
    return;
  }

  // One header byte every 200 ms keeps any per-recv timeout from firing.
  std::atomic<bool> trickling{true};
  std::thread trickle([&]() {
    send_text(client, "GET / HTTP/1.1\r\n");
    while (trickling) {
      send_text(client, "X");
      std::this_thread::sleep_for(200ms);
    }
  });

  check(wait_for([&]() { return serving.svr.active_connections() == 1; }),
        "trickling connection is being read");
  std::this_thread::sleep_for(300ms);

  auto started = std::chrono::steady_clock::now();
  serving.stop();
  bool returned = serving.returned_within(2s);
  auto took = std::chrono::steady_clock::now() - started;

  trickling = false;
  trickle.join();
  close(client);

  check(returned, "serve returns after stop with a trickling client open");
  check(took < 2s, "stop is not held by the trickling client");
}

static void test_idle_connection_does_not_delay_requests() {
  TempDir site("conn-idle");
  site.write("index.html", "prompt\n");
  ServingThread serving(site.path);
  check(serving.bound, "idle server bound");
  if (!serving.bound) {
    return;
  }

  int idle = connect_raw(serving.port);
  check(idle >= 0, "idle client connected");
  check(wait_for([&]() { return serving.svr.active_connections() == 1; }),
        "idle connection accepted");

  auto started = std::chrono::steady_clock::now();
  auto res = http_request(serving.port, "/");
  auto took = std::chrono::steady_clock::now() - started;

  check(res.result_int() == 200 && res.body() == "prompt\n",
        "request is served while another connection is idle");
  check(took < 1s, "idle connection does not delay the next request");

  serving.stop();
  check(serving.returned_within(2s), "stop does not wait for the idle client");
  if (idle >= 0) {
    close(idle);
  }
}

static void test_response_in_flight_completes_on_stop() {
  TempDir site("conn-inflight");
  std::string big(8 * 1024 * 1024, 'a');
  site.write("big.bin", big);
  ServingThread serving(site.path);
  check(serving.bound, "in-flight server bound");
  if (!serving.bound) {
    return;
  }

  int client = connect_raw(serving.port);
  check(client >= 0, "slow reader connected");
  if (client < 0) {
    return;
  }
  send_text(client, "GET /big.bin HTTP/1.1\r\nHost: localhost\r\n\r\n");

  // The response is larger than the socket buffers, so the worker is still
  // sending when stop() arrives.
  check(wait_for([&]() { return serving.svr.active_connections() == 1; }),
        "large response is being sent");
  std::this_thread::sleep_for(100ms);
  serving.stop();

  std::string raw = read_to_eof(client);
  close(client);

  size_t header_end = raw.find("\r\n\r\n");
  size_t body_size =
      header_end == std::string::npos ? 0 : raw.size() - header_end - 4;
  check(raw.rfind("HTTP/1.1 200", 0) == 0, "in-flight response starts 200");
  check(body_size == big.size(), "in-flight response is sent in full");
  check(serving.returned_within(2s), "serve returns once the response is out");
}

static void test_descriptor_exhaustion_backs_off() {
  TempDir site("conn-emfile");
  site.write("index.html", "recovered\n");
  ServingThread serving(site.path);
  check(serving.bound, "exhaustion server bound");
  if (!serving.bound) {
    return;
  }

  int client = socket(AF_INET, SOCK_STREAM, 0);
  int lowest_free = dup(client);
  check(client >= 0 && lowest_free >= 0, "descriptors for the client");
  if (client < 0 || lowest_free < 0) {
    return;
  }
  close(lowest_free);

  rlimit original{};
  getrlimit(RLIMIT_NOFILE, &original);
  rlimit lowered = original;
  lowered.rlim_cur = static_cast<rlim_t>(lowest_free);
  check(setrlimit(RLIMIT_NOFILE, &lowered) == 0, "descriptor limit lowered");

  // connect() needs no new descriptor, accept() on the server side does.
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(serving.port);
  bool connected = connect(client, (sockaddr *)&addr, sizeof(addr)) == 0;

  double cpu_before = cpu_seconds();
  std::this_thread::sleep_for(500ms);
  double cpu_used = cpu_seconds() - cpu_before;

  setrlimit(RLIMIT_NOFILE, &original);

  check(connected, "client connected while descriptors were exhausted");
  check(cpu_used < 0.2, "accept loop backs off while descriptors run out");

  send_text(client, "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");
  std::string raw = read_to_eof(client);
  close(client);
  check(raw.find("recovered\n") != std::string::npos,
        "pending connection is served once descriptors free up");
}

int main() {
  test_trickling_client_does_not_hold_stop();
  test_idle_connection_does_not_delay_requests();
  test_response_in_flight_completes_on_stop();
  test_descriptor_exhaustion_backs_off();
  return finish();
}
