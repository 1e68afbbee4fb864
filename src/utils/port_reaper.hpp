#ifndef PORT_REAPER_HPP
#define PORT_REAPER_HPP

#include <filesystem>
#include <string>
#include <sys/types.h>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

enum class ReclaimOutcome { NoListener, Terminated };

struct ReclaimResult {
  ReclaimOutcome outcome = ReclaimOutcome::NoListener;
  std::vector<pid_t> terminated;
  // Non-fatal problems met while querying or signalling.
  std::vector<std::string> failures;
};

// Finds the processes listening on a TCP port through the proc filesystem
// and kills them. Never throws; the later bind is what decides whether the
// port is really free.
class PortReaper {
private:
  fs::path proc_root;

  void collect_inodes(const fs::path &table, int port,
                      std::unordered_set<unsigned long> &inodes,
                      std::vector<std::string> *failures) const;

  std::vector<pid_t>
  owners_of(const std::unordered_set<unsigned long> &inodes) const;

public:
  explicit PortReaper(fs::path proc = "/proc");

  std::unordered_set<unsigned long>
  listening_inodes(int port,
                   std::vector<std::string> *failures = nullptr) const;

  // Pids holding a listening socket on `port`, excluding the caller.
  std::vector<pid_t>
  find_listeners(int port, std::vector<std::string> *failures = nullptr) const;

  ReclaimResult reclaim(int port) const;
};

#endif // PORT_REAPER_HPP
