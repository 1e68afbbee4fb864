#ifndef PREVIEW_SERVER_HPP
#define PREVIEW_SERVER_HPP

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

enum class SessionState { Starting, Serving, Stopping, Stopped };

const char *to_string(SessionState state);

namespace exit_code {
constexpr int OK = 0;
constexpr int BIND_FAILED = 1;
constexpr int ROOT_UNREADABLE = 2;
} // namespace exit_code

// Runs one static file session per run() call and blocks the caller until
// SIGINT/SIGTERM or stop().
class PreviewServer {
public:
  explicit PreviewServer(std::string host = "0.0.0.0", bool verbose = false);

  PreviewServer(const PreviewServer &) = delete;
  PreviewServer &operator=(const PreviewServer &) = delete;

  int run(int port, const fs::path &root);

  // Same effect as an interrupt while serving; a no-op in any other state.
  // Safe from any thread.
  void stop();

  SessionState state() const { return state_.load(); }

  // Empty when the root can be served, otherwise the reason it cannot.
  static std::string check_root(const fs::path &root);

private:
  std::string host_;
  bool verbose_;
  std::atomic<SessionState> state_{SessionState::Stopped};
  std::atomic<unsigned> session_id_{0};
  boost::asio::io_context ioc_;
  boost::asio::signal_set *signals_ = nullptr;
};

#endif
