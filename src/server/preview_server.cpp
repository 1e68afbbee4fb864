#include "preview_server.hpp"
#include "server.hpp"
#include <boost/asio/post.hpp>
#include <chrono>
#include <csignal>
#include <ctime>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <termcolor/termcolor.hpp>
#include <thread>
#include <unistd.h>

namespace net = boost::asio;

static std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

static void log_request(const Request &req, const Response &res) {
  std::cout << termcolor::bright_blue << "[" << get_timestamp() << "]"
            << termcolor::reset << " ";

  if (req.method == "GET") {
    std::cout << termcolor::bright_cyan;
  } else if (req.method == "HEAD") {
    std::cout << termcolor::bright_magenta;
  } else {
    std::cout << termcolor::bright_yellow;
  }
  std::cout << req.method << termcolor::reset << " ";

  std::cout << termcolor::white << req.path << termcolor::reset << " ";

  if (res.status >= 200 && res.status < 300) {
    std::cout << termcolor::bright_green;
  } else if (res.status >= 300 && res.status < 400) {
    std::cout << termcolor::bright_yellow;
  } else if (res.status >= 400 && res.status < 500) {
    std::cout << termcolor::bright_red;
  } else if (res.status >= 500) {
    std::cout << termcolor::red << termcolor::bold;
  }
  std::cout << res.status << termcolor::reset << " " << termcolor::bright_blue
            << res.body.size() << "B" << termcolor::reset;

  std::cout << std::endl;
}

const char *to_string(SessionState state) {
  switch (state) {
  case SessionState::Starting:
    return "starting";
  case SessionState::Serving:
    return "serving";
  case SessionState::Stopping:
    return "stopping";
  case SessionState::Stopped:
    return "stopped";
  }
  return "unknown";
}

PreviewServer::PreviewServer(std::string host, bool verbose)
    : host_(std::move(host)), verbose_(verbose) {}

std::string PreviewServer::check_root(const fs::path &root) {
  std::error_code ec;
  auto status = fs::status(root, ec);
  if (ec || !fs::exists(status)) {
    return "directory not found";
  }
  if (!fs::is_directory(status)) {
    return "not a directory";
  }
  if (access(root.c_str(), R_OK | X_OK) != 0) {
    return std::string("not readable: ") + strerror(errno);
  }
  return "";
}

int PreviewServer::run(int port, const fs::path &root) {
  ++session_id_;
  state_ = SessionState::Starting;

  std::string root_problem = check_root(root);
  if (!root_problem.empty()) {
    std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
              << "Cannot serve content root\n";
    std::cerr << termcolor::bright_blue << "  Path: " << termcolor::reset
              << root << "\n";
    std::cerr << termcolor::yellow << "  → " << termcolor::reset
              << root_problem << "\n\n";
    state_ = SessionState::Stopped;
    return exit_code::ROOT_UNREADABLE;
  }

  Server svr(root);
  svr.set_verbose(verbose_);
  svr.set_logger(log_request);

  // Installed before bind so an interrupt never meets the default handler
  // once the session is visible as serving.
  ioc_.restart();
  net::signal_set signals(ioc_, SIGINT, SIGTERM);

  if (!svr.bind(host_, port)) {
    std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
              << "Could not start server on port " << termcolor::bright_white
              << port << termcolor::reset << "\n";
    std::cerr << termcolor::bright_blue << "  Reason: " << termcolor::reset
              << svr.error() << "\n";
    std::cerr << termcolor::yellow << "  → " << termcolor::reset
              << "Free the port and run again\n\n";
    state_ = SessionState::Stopped;
    return exit_code::BIND_FAILED;
  }

  std::thread server_thread([&svr]() { svr.serve(); });

  // Handlers run on this thread only, inside ioc_.run().
  signals_ = &signals;
  signals.async_wait(
      [this, &svr](const boost::system::error_code &ec, int signal_number) {
        signals_ = nullptr;
        state_ = SessionState::Stopping;

        if (!ec) {
          std::cout << "\n"
                    << termcolor::yellow << "⏳ Received "
                    << (signal_number == SIGINT ? "SIGINT" : "SIGTERM")
                    << ", shutting down..." << termcolor::reset << "\n";
        } else {
          std::cout << termcolor::yellow << "⏳ Shutting down..."
                    << termcolor::reset << "\n";
        }

        svr.stop();
      });

  state_ = SessionState::Serving;
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Server started on " << termcolor::bright_cyan << host_ << ":"
            << port << termcolor::reset << "\n\n";

  // Blocks until the wait completes; the signal set stays installed until
  // this function returns so a second interrupt is absorbed.
  ioc_.run();

  if (server_thread.joinable()) {
    server_thread.join();
  }
  svr.close_listener();

  state_ = SessionState::Stopped;
  std::cout << termcolor::bright_green << "✓ Server stopped cleanly"
            << termcolor::reset << "\n\n";
  return exit_code::OK;
}

void PreviewServer::stop() {
  // A post that outlives its session must not cancel the next one's wait.
  unsigned session = session_id_.load();
  if (state_.load() != SessionState::Serving) {
    return;
  }

  net::post(ioc_, [this, session]() {
    if (signals_ && session == session_id_.load()) {
      signals_->cancel();
    }
  });
}
