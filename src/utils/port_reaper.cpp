#include "port_reaper.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace {

constexpr const char *TCP_LISTEN_STATE = "0A";

bool is_number(const std::string &str) {
  return !str.empty() &&
         std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

// "0100007F:1F40" -> 8000
int parse_local_port(const std::string &address) {
  size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 >= address.size()) {
    return -1;
  }
  try {
    return std::stoi(address.substr(colon + 1), nullptr, 16);
  } catch (const std::exception &) {
    return -1;
  }
}

// "socket:[12345]" -> 12345
bool parse_socket_inode(const std::string &link, unsigned long &inode) {
  const std::string prefix = "socket:[";
  if (link.size() <= prefix.size() + 1 ||
      link.compare(0, prefix.size(), prefix) != 0 || link.back() != ']') {
    return false;
  }
  std::string digits =
      link.substr(prefix.size(), link.size() - prefix.size() - 1);
  if (!is_number(digits)) {
    return false;
  }
  try {
    inode = std::stoul(digits);
  } catch (const std::exception &) {
    return false;
  }
  return true;
}

} // namespace

PortReaper::PortReaper(fs::path proc) : proc_root(std::move(proc)) {}

void PortReaper::collect_inodes(const fs::path &table, int port,
                                std::unordered_set<unsigned long> &inodes,
                                std::vector<std::string> *failures) const {
  std::ifstream file(table);
  if (!file.is_open()) {
    // tcp6 is absent on hosts without IPv6.
    if (failures && table.filename() == "tcp") {
      failures->push_back("cannot read " + table.string());
    }
    return;
  }

  std::string line;
  std::getline(file, line); // header

  while (std::getline(file, line)) {
    std::istringstream fields(line);
    std::string slot, local, remote, state, queues, timer, retransmits, uid,
        timeout, inode;
    if (!(fields >> slot >> local >> remote >> state >> queues >> timer >>
          retransmits >> uid >> timeout >> inode)) {
      continue;
    }

    if (state != TCP_LISTEN_STATE || parse_local_port(local) != port) {
      continue;
    }

    unsigned long value = 0;
    if (parse_socket_inode("socket:[" + inode + "]", value) && value != 0) {
      inodes.insert(value);
    }
  }
}

std::unordered_set<unsigned long>
PortReaper::listening_inodes(int port,
                             std::vector<std::string> *failures) const {
  std::unordered_set<unsigned long> inodes;
  if (port < 1 || port > 65535) {
    return inodes;
  }

  collect_inodes(proc_root / "net" / "tcp", port, inodes, failures);
  collect_inodes(proc_root / "net" / "tcp6", port, inodes, failures);
  return inodes;
}

std::vector<pid_t> PortReaper::owners_of(
    const std::unordered_set<unsigned long> &inodes) const {
  std::vector<pid_t> pids;
  if (inodes.empty()) {
    return pids;
  }

  const std::string self = std::to_string(getpid());

  // /proc changes under us; iterate with error codes so a vanished
  // process ends its own scan instead of throwing.
  std::error_code ec;
  for (fs::directory_iterator it(proc_root, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (!is_number(name) || name == self) {
      continue;
    }

    // Processes owned by other users are unreadable; they are skipped.
    std::error_code fd_ec;
    for (fs::directory_iterator fd(it->path() / "fd", fd_ec), fd_end;
         !fd_ec && fd != fd_end; fd.increment(fd_ec)) {
      std::error_code link_ec;
      fs::path target = fs::read_symlink(fd->path(), link_ec);
      unsigned long inode = 0;
      if (!link_ec && parse_socket_inode(target.string(), inode) &&
          inodes.count(inode) > 0) {
        pids.push_back(static_cast<pid_t>(std::stol(name)));
        break;
      }
    }
  }

  std::sort(pids.begin(), pids.end());
  return pids;
}

std::vector<pid_t>
PortReaper::find_listeners(int port,
                           std::vector<std::string> *failures) const {
  return owners_of(listening_inodes(port, failures));
}

ReclaimResult PortReaper::reclaim(int port) const {
  ReclaimResult result;

  for (pid_t pid : find_listeners(port, &result.failures)) {
    if (::kill(pid, SIGKILL) == 0) {
      result.terminated.push_back(pid);
    } else {
      result.failures.push_back("kill " + std::to_string(pid) + ": " +
                                std::strerror(errno));
    }
  }

  if (!result.terminated.empty()) {
    result.outcome = ReclaimOutcome::Terminated;
  }
  return result;
}
