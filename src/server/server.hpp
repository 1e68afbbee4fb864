#pragma once

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <termcolor/termcolor.hpp>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <vector>

struct Request {
  std::string method;
  std::string path;
  std::string version;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct Response {
  int status = 200;
  std::map<std::string, std::string> headers;
  std::string body;

  void set_content(const std::string &content, const std::string &type) {
    body = content;
    headers["Content-Type"] = type;
  }

  // HEAD responses keep Content-Length but drop the body.
  std::string to_http(bool include_body = true) const {
    std::ostringstream oss;
    std::string status_text = get_status_text(status);

    oss << "HTTP/1.1 " << status << " " << status_text << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";

    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    if (include_body) {
      oss << body;
    }
    return oss.str();
  }

  static std::string get_status_text(int code) {
    switch (code) {
    case 200:
      return "OK";
    case 301:
      return "Moved Permanently";
    case 400:
      return "Bad Request";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    default:
      return "Unknown";
    }
  }
};

using Logger = std::function<void(const Request &, const Response &)>;

// Blocking static file server for a single content root. bind() and serve()
// are separate so the caller sees a bind failure before anything is served;
// stop() may be called from any thread and unblocks serve().
class Server {
private:
  static constexpr size_t MAX_REQUEST_BYTES = 64 * 1024;
  static constexpr int CLIENT_TIMEOUT_SECONDS = 5;
  static constexpr int POLL_SLICE_MS = 50;
  static constexpr int ACCEPT_BACKOFF_MS = 100;

  int server_fd = -1;
  std::atomic<bool> running{false};
  std::filesystem::path root;
  std::string last_error;
  Logger logger;
  mutable std::mutex log_mutex;
  bool verbose_logging = false;

  mutable std::mutex workers_mutex;
  std::condition_variable workers_done;
  size_t active_workers = 0;

  static Request parse_request(const std::string &raw) {
    Request req;
    std::istringstream iss(raw);
    std::string line;

    auto trim_cr = [](std::string &s) {
      if (!s.empty() && s.back() == '\r') {
        s.pop_back();
      }
    };

    if (std::getline(iss, line)) {
      trim_cr(line);
      std::istringstream line_stream(line);
      line_stream >> req.method >> req.path >> req.version;
    }

    while (std::getline(iss, line)) {
      trim_cr(line);
      if (line.empty()) {
        break;
      }
      size_t colon = line.find(':');
      if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        req.headers[key] = value_start == std::string::npos
                               ? std::string()
                               : line.substr(value_start);
      }
    }

    return req;
  }

  static bool ends_with(const std::string &str, const std::string &suffix) {
    if (suffix.size() > str.size())
      return false;
    return std::equal(suffix.begin(), suffix.end(),
                      str.end() - suffix.size(), [](char a, char b) {
                        return std::tolower(static_cast<unsigned char>(a)) ==
                               std::tolower(static_cast<unsigned char>(b));
                      });
  }

  static int hex_value(char c) {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }

  static std::string url_decode(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
      if (in[i] == '%' && i + 2 < in.size()) {
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi >= 0 && lo >= 0) {
          out += static_cast<char>(hi * 16 + lo);
          i += 2;
          continue;
        }
      }
      out += in[i];
    }
    return out;
  }

  static std::string url_encode(const std::string &in) {
    static const char *digits = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
      if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
          c == '/') {
        out += static_cast<char>(c);
      } else {
        out += '%';
        out += digits[c >> 4];
        out += digits[c & 0x0F];
      }
    }
    return out;
  }

  static std::string html_escape(const std::string &in) {
    std::string out;
    for (char c : in) {
      switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out += c;
      }
    }
    return out;
  }

  static void set_error_page(Response &res, int status) {
    res.status = status;
    std::string text = Response::get_status_text(status);
    res.set_content("<h1>" + std::to_string(status) + " - " + text + "</h1>",
                    "text/html");
  }

  bool serve_file(const std::filesystem::path &file_path,
                  Response &res) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
      return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
      return false;
    }

    res.set_content(content, get_mime_type(file_path.string()));

    if (verbose_logging) {
      std::cout << "[STATIC] ✓ " << content.size() << " bytes" << std::endl;
    }
    return true;
  }

  void serve_listing(const std::filesystem::path &dir,
                     const std::string &url_path, Response &res) const {
    std::vector<std::string> names;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end;
         !ec && it != end; it.increment(ec)) {
      std::string name = it->path().filename().string();
      std::error_code type_ec;
      if (it->is_directory(type_ec)) {
        name += "/";
      }
      names.push_back(name);
    }

    if (ec) {
      set_error_page(res, 404);
      return;
    }

    std::sort(names.begin(), names.end());

    std::string title = "Directory listing for " + html_escape(url_path);
    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n</head>\n<body>\n"
         << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto &name : names) {
      html << "<li><a href=\"" << url_encode(name) << "\">"
           << html_escape(name) << "</a></li>\n";
    }
    html << "</ul>\n<hr>\n</body>\n</html>\n";

    res.set_content(html.str(), "text/html");
  }

  using Clock = std::chrono::steady_clock;

  // Waits for `events` on `fd` until `deadline`. While reading, a stop()
  // also ends the wait so idle connections do not hold shutdown.
  bool wait_ready(int fd, short events, Clock::time_point deadline,
                  bool abort_on_stop) const {
    for (;;) {
      if (abort_on_stop && !running) {
        return false;
      }

      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - Clock::now());
      if (left.count() <= 0) {
        return false;
      }

      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = events;
      int slice = static_cast<int>(
          std::min<long long>(left.count(), POLL_SLICE_MS));
      int ready = poll(&pfd, 1, slice);
      if (ready < 0 && errno != EINTR) {
        return false;
      }
      if (ready > 0) {
        return true;
      }
    }
  }

  std::string read_request(int client_fd, Clock::time_point deadline) const {
    std::string raw;
    char buffer[8192];

    while (raw.find("\r\n\r\n") == std::string::npos &&
           raw.size() < MAX_REQUEST_BYTES) {
      if (!wait_ready(client_fd, POLLIN, deadline, true)) {
        return "";
      }
      ssize_t bytes = recv(client_fd, buffer, sizeof(buffer), 0);
      if (bytes < 0 && errno == EINTR) {
        continue;
      }
      if (bytes <= 0) {
        break;
      }
      raw.append(buffer, static_cast<size_t>(bytes));
    }
    return raw;
  }

  // The response is always completed, stop() or not, within the deadline.
  void send_all(int client_fd, const std::string &data,
                Clock::time_point deadline) const {
    size_t sent = 0;
    while (sent < data.size()) {
      if (!wait_ready(client_fd, POLLOUT, deadline, false)) {
        return;
      }
      ssize_t n = send(client_fd, data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL | MSG_DONTWAIT);
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        continue;
      }
      if (n <= 0) {
        return;
      }
      sent += static_cast<size_t>(n);
    }
  }

  void handle_client(int client_fd) {
    auto deadline =
        Clock::now() + std::chrono::seconds(CLIENT_TIMEOUT_SECONDS);

    std::string raw = read_request(client_fd, deadline);
    if (raw.empty()) {
      close(client_fd);
      return;
    }

    Request req = parse_request(raw);
    Response res;

    try {
      res = handle(req);
    } catch (const std::exception &e) {
      std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
                << req.path << ": " << e.what() << "\n";
      res = Response();
      set_error_page(res, 500);
    }
    res.headers["Connection"] = "close";

    if (logger) {
      std::lock_guard<std::mutex> lock(log_mutex);
      logger(req, res);
    }

    send_all(client_fd, res.to_http(req.method != "HEAD"), deadline);
    close(client_fd);
  }

  void start_worker(int client_fd) {
    {
      std::lock_guard<std::mutex> lock(workers_mutex);
      ++active_workers;
    }

    try {
      std::thread([this, client_fd]() {
        handle_client(client_fd);
        std::lock_guard<std::mutex> lock(workers_mutex);
        --active_workers;
        workers_done.notify_all();
      }).detach();
    } catch (const std::system_error &e) {
      std::cerr << termcolor::bright_red << "✗ Could not start worker: "
                << termcolor::reset << e.what() << "\n";
      close(client_fd);
      std::lock_guard<std::mutex> lock(workers_mutex);
      --active_workers;
    }
  }

  static bool is_resource_exhaustion(int err) {
    return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
  }

public:
  explicit Server(std::filesystem::path root_dir) : root(std::move(root_dir)) {}

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  ~Server() {
    stop();
    close_listener();
  }

  void set_logger(Logger log_handler) { logger = std::move(log_handler); }

  void set_verbose(bool verbose) { verbose_logging = verbose; }

  const std::string &error() const { return last_error; }

  static std::string get_mime_type(const std::string &path) {
    if (ends_with(path, ".html") || ends_with(path, ".htm"))
      return "text/html";
    if (ends_with(path, ".css"))
      return "text/css";
    if (ends_with(path, ".js") || ends_with(path, ".mjs"))
      return "application/javascript";
    if (ends_with(path, ".json") || ends_with(path, ".map"))
      return "application/json";
    if (ends_with(path, ".png"))
      return "image/png";
    if (ends_with(path, ".jpg") || ends_with(path, ".jpeg"))
      return "image/jpeg";
    if (ends_with(path, ".gif"))
      return "image/gif";
    if (ends_with(path, ".webp"))
      return "image/webp";
    if (ends_with(path, ".avif"))
      return "image/avif";
    if (ends_with(path, ".svg"))
      return "image/svg+xml";
    if (ends_with(path, ".ico"))
      return "image/x-icon";
    if (ends_with(path, ".woff"))
      return "font/woff";
    if (ends_with(path, ".woff2"))
      return "font/woff2";
    if (ends_with(path, ".ttf"))
      return "font/ttf";
    if (ends_with(path, ".otf"))
      return "font/otf";
    if (ends_with(path, ".wasm"))
      return "application/wasm";
    if (ends_with(path, ".mp4"))
      return "video/mp4";
    if (ends_with(path, ".webm"))
      return "video/webm";
    if (ends_with(path, ".mp3"))
      return "audio/mpeg";
    if (ends_with(path, ".pdf"))
      return "application/pdf";
    if (ends_with(path, ".xml"))
      return "application/xml";
    if (ends_with(path, ".csv"))
      return "text/csv";
    if (ends_with(path, ".md"))
      return "text/markdown";
    if (ends_with(path, ".txt"))
      return "text/plain";
    return "application/octet-stream";
  }

  // Maps a request onto the content root. Never touches sockets, so it can
  // be exercised directly.
  Response handle(const Request &req) const {
    Response res;

    if (req.method != "GET" && req.method != "HEAD") {
      set_error_page(res, 501);
      return res;
    }

    std::string url_path = req.path;
    std::string query;
    size_t cut = url_path.find_first_of("?#");
    if (cut != std::string::npos) {
      if (url_path[cut] == '?') {
        query = url_path.substr(cut, url_path.find('#', cut) - cut);
      }
      url_path = url_path.substr(0, cut);
    }

    std::string decoded = url_decode(url_path);
    if (decoded.empty() || decoded[0] != '/' ||
        decoded.find('\0') != std::string::npos) {
      set_error_page(res, 400);
      return res;
    }

    size_t rel_start = decoded.find_first_not_of('/');
    std::filesystem::path relative =
        rel_start == std::string::npos
            ? std::filesystem::path()
            : std::filesystem::path(decoded.substr(rel_start))
                  .lexically_normal();

    if (!relative.empty() && *relative.begin() == "..") {
      set_error_page(res, 403);
      return res;
    }

    std::filesystem::path file_path = root / relative;

    if (verbose_logging) {
      std::cout << "[STATIC] " << req.path << " → " << file_path.string()
                << std::endl;
    }

    std::error_code ec;
    auto status = std::filesystem::status(file_path, ec);

    if (!ec && std::filesystem::is_directory(status)) {
      if (url_path.back() != '/') {
        res.status = 301;
        res.headers["Location"] = url_path + "/" + query;
        res.set_content("", "text/html");
        return res;
      }

      for (const char *index : {"index.html", "index.htm"}) {
        std::error_code index_ec;
        if (std::filesystem::is_regular_file(file_path / index, index_ec) &&
            serve_file(file_path / index, res)) {
          return res;
        }
      }

      serve_listing(file_path, decoded, res);
      return res;
    }

    if (!ec && std::filesystem::is_regular_file(status) &&
        serve_file(file_path, res)) {
      return res;
    }

    if (verbose_logging) {
      std::cout << "[STATIC] ✗ Not found" << std::endl;
    }

    set_error_page(res, 404);
    return res;
  }

  bool bind(const std::string &host, int port) {
    last_error.clear();

    server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd == -1) {
      last_error = std::string("failed to create socket: ") + strerror(errno);
      return false;
    }

    // No SO_REUSEPORT: a port held by another listener must fail here.
    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) <
        0) {
      std::cerr << termcolor::bright_yellow << "⚠ " << termcolor::reset
                << "Failed to set SO_REUSEADDR: " << strerror(errno) << "\n";
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
      last_error = "invalid IPv4 address: " + host;
      close_listener();
      return false;
    }

    if (::bind(server_fd, (sockaddr *)&addr, sizeof(addr)) < 0) {
      last_error = "bind failed on port " + std::to_string(port) + ": " +
                   strerror(errno);
      close_listener();
      return false;
    }

    if (::listen(server_fd, SOMAXCONN) < 0) {
      last_error = "listen failed on port " + std::to_string(port) + ": " +
                   strerror(errno);
      close_listener();
      return false;
    }

    running = true;
    return true;
  }

  // Accept loop; each connection gets its own worker thread. Returns once
  // stop() has been called and every in-flight connection has finished.
  void serve() {
    while (running) {
      sockaddr_in client_addr{};
      socklen_t client_len = sizeof(client_addr);
      int client_fd = accept(server_fd, (sockaddr *)&client_addr, &client_len);

      if (client_fd < 0) {
        int err = errno;
        if (!running) {
          break;
        }
        if (err != EINTR && err != ECONNABORTED) {
          std::cerr << termcolor::bright_red << "✗ Accept failed: "
                    << termcolor::reset << strerror(err) << "\n";
        }
        if (is_resource_exhaustion(err)) {
          std::this_thread::sleep_for(
              std::chrono::milliseconds(ACCEPT_BACKOFF_MS));
        }
        continue;
      }

      start_worker(client_fd);
    }

    std::unique_lock<std::mutex> lock(workers_mutex);
    workers_done.wait(lock, [this]() { return active_workers == 0; });
  }

  size_t active_connections() const {
    std::lock_guard<std::mutex> lock(workers_mutex);
    return active_workers;
  }

  void stop() {
    if (running.exchange(false) && server_fd != -1) {
      ::shutdown(server_fd, SHUT_RDWR);
    }
  }

  // Only after serve() has returned.
  void close_listener() {
    if (server_fd != -1) {
      close(server_fd);
      server_fd = -1;
    }
  }
};
