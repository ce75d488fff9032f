#include "snowweb/subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "snowweb/base-fd.hpp"
#include "snowweb/errno-throw.hpp"
#include "snowweb/log.hpp"

extern char** environ;  // NOLINT

namespace snowweb {

namespace {

void CheckSpawnCall(int err, const char* what) {
  if (err != 0) {
    throw std::system_error(err, std::generic_category(), std::string(what) + " failed");
  }
}

struct SpawnFileActions {
  SpawnFileActions() {
    CheckSpawnCall(::posix_spawn_file_actions_init(&actions), "posix_spawn_file_actions_init");
  }

  SpawnFileActions(const SpawnFileActions&) = delete;
  SpawnFileActions& operator=(const SpawnFileActions&) = delete;

  ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&actions); }

  posix_spawn_file_actions_t actions;
};

struct SpawnAttr {
  SpawnAttr() {
    CheckSpawnCall(::posix_spawnattr_init(&attr), "posix_spawnattr_init");
  }

  SpawnAttr(const SpawnAttr&) = delete;
  SpawnAttr& operator=(const SpawnAttr&) = delete;

  ~SpawnAttr() { ::posix_spawnattr_destroy(&attr); }

  posix_spawnattr_t attr;
};

std::vector<std::string> BuildEnvironment(const EnvironmentOverrides& envOverrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view kv(*entry);
    const auto name = kv.substr(0, kv.find('='));
    bool overridden = false;
    for (const auto& [key, value] : envOverrides) {
      if (key == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env.emplace_back(kv);
    }
  }
  for (const auto& [key, value] : envOverrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char*> ToCharPtrs(std::span<std::string> strings) {
  std::vector<char*> ptrs;
  ptrs.reserve(strings.size() + 1U);
  for (auto& str : strings) {
    ptrs.push_back(str.data());
  }
  ptrs.push_back(nullptr);
  return ptrs;
}

}  // namespace

CommandResult RunCommand(std::span<const std::string> argv, const EnvironmentOverrides& envOverrides) {
  if (argv.empty()) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument), "empty command");
  }

  std::array<int, 2> pipeFds;
  if (::pipe2(pipeFds.data(), O_CLOEXEC) != 0) {
    ThrowErrno("pipe2 failed");
  }
  BaseFd readEnd(pipeFds[0]);
  BaseFd writeEnd(pipeFds[1]);

  SpawnFileActions fileActions;
  CheckSpawnCall(::posix_spawn_file_actions_adddup2(&fileActions.actions, writeEnd.fd(), STDOUT_FILENO),
                 "posix_spawn_file_actions_adddup2");

  // The child starts with no blocked signal and default dispositions, ignored SIGPIPE included.
  SpawnAttr spawnAttr;
  sigset_t emptyMask;
  ::sigemptyset(&emptyMask);
  sigset_t defaultSignals;
  ::sigfillset(&defaultSignals);
  CheckSpawnCall(::posix_spawnattr_setsigmask(&spawnAttr.attr, &emptyMask), "posix_spawnattr_setsigmask");
  CheckSpawnCall(::posix_spawnattr_setsigdefault(&spawnAttr.attr, &defaultSignals), "posix_spawnattr_setsigdefault");
  CheckSpawnCall(::posix_spawnattr_setflags(&spawnAttr.attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF),
                 "posix_spawnattr_setflags");

  std::vector<std::string> args(argv.begin(), argv.end());
  std::vector<std::string> env = BuildEnvironment(envOverrides);
  auto argPtrs = ToCharPtrs(args);
  auto envPtrs = ToCharPtrs(env);

  pid_t pid = -1;
  if (const int err =
          ::posix_spawnp(&pid, args.front().c_str(), &fileActions.actions, &spawnAttr.attr, argPtrs.data(),
                         envPtrs.data());
      err != 0) {
    throw std::system_error(err, std::generic_category(), "Unable to spawn '" + args.front() + "'");
  }
  writeEnd.close();
  log::debug("Spawned pid {}: {}", pid, FormatCommand(argv));

  CommandResult result;
  std::array<char, 4096> buf;
  while (true) {
    const auto nbRead = ::read(readEnd.fd(), buf.data(), buf.size());
    if (nbRead > 0) {
      result.stdoutData.append(buf.data(), static_cast<std::size_t>(nbRead));
    } else if (nbRead == 0) {
      break;
    } else if (errno != EINTR) {
      log::error("Reading output of pid {} failed: {}", pid, std::strerror(errno));
      break;
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      ThrowErrno("waitpid failed for pid {}", pid);
    }
  }
  if (WIFEXITED(status)) {
    result.exitStatus = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitStatus = 128 + WTERMSIG(status);
  }
  log::debug("pid {} exited with status {}", pid, result.exitStatus);
  return result;
}

std::string FormatCommand(std::span<const std::string> argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(arg);
  }
  return out;
}

}  // namespace snowweb
