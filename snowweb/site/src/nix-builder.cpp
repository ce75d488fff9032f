#include "snowweb/nix-builder.hpp"

#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "snowweb/content-root.hpp"
#include "snowweb/error.hpp"
#include "snowweb/json-serializer.hpp"
#include "snowweb/log.hpp"
#include "snowweb/subprocess.hpp"

namespace snowweb {

namespace {

struct BuildOutputs {
  std::string out;
};

struct BuildResult {
  BuildOutputs outputs;
};

struct PathInfo {
  std::string narHash;
};

constexpr std::string_view kNixFlags[] = {"--refresh", "--experimental-features", "nix-command flakes"};

std::vector<std::string> NixArgv(const std::string& command) {
  std::vector<std::string> argv{command};
  argv.insert(argv.end(), std::begin(kNixFlags), std::end(kNixFlags));
  return argv;
}

char FirstNonSpace(std::string_view json) {
  const auto pos = json.find_first_not_of(" \t\r\n");
  return pos == std::string_view::npos ? '\0' : json[pos];
}

}  // namespace

NixBuilderConfig& NixBuilderConfig::withCommand(std::string_view executable) {
  command = executable;
  return *this;
}

NixBuilderConfig& NixBuilderConfig::withProfile(std::string_view profilePath) {
  profile = profilePath;
  return *this;
}

NixBuilder::NixBuilder(NixBuilderConfig config) : _config(std::move(config)) {}

std::vector<std::string> NixBuilder::buildCommand(std::string_view installable) const {
  auto argv = NixArgv(_config.command);
  argv.emplace_back("build");
  argv.emplace_back(installable);
  argv.emplace_back("--json");
  argv.emplace_back("--no-link");
  if (!_config.profile.empty()) {
    argv.emplace_back("--profile");
    argv.push_back(_config.profile);
  }
  return argv;
}

std::vector<std::string> NixBuilder::pathInfoCommand(std::string_view storePath) const {
  auto argv = NixArgv(_config.command);
  argv.emplace_back("path-info");
  argv.emplace_back("--json");
  argv.emplace_back(storePath);
  return argv;
}

std::string NixBuilder::run(const std::vector<std::string>& argv) const {
  const auto command = FormatCommand(argv);
  log::debug("Running '{}'", command);
  CommandResult result;
  try {
    result = RunCommand(argv);
  } catch (const std::system_error&) {
    ThrowWithCause(ErrorKind::Build, "unable to run nix", {{"command", command}});
  }
  if (result.exitStatus != 0) {
    throw Error(ErrorKind::Build, "nix command failed",
                {{"command", command}, {"status", std::to_string(result.exitStatus)}});
  }
  return std::move(result.stdoutData);
}

ContentRoot NixBuilder::build(std::string_view installable) {
  ContentRoot root;
  root.path = ParseBuildOutput(run(buildCommand(installable)));
  log::debug("Built {} to {}", installable, root.path);
  root.hash = ParseNarHash(run(pathInfoCommand(root.path)), root.path);
  return root;
}

std::string ParseBuildOutput(const std::string& json) {
  std::vector<BuildResult> results;
  if (auto err = ParseJson(json, results); !err.empty()) {
    throw Error(ErrorKind::BuildOutput, "invalid JSON from nix build", {{"detail", std::move(err)}});
  }
  if (results.empty()) {
    throw Error(ErrorKind::BuildOutput, "nix build returned no result");
  }
  if (results.front().outputs.out.empty()) {
    throw Error(ErrorKind::BuildOutput, "nix build result has no 'out' output");
  }
  return std::move(results.front().outputs.out);
}

std::string ParseNarHash(const std::string& json, std::string_view storePath) {
  std::string narHash;
  if (FirstNonSpace(json) == '{') {
    std::map<std::string, PathInfo> infos;
    if (auto err = ParseJson(json, infos); !err.empty()) {
      throw Error(ErrorKind::BuildOutput, "invalid JSON from nix path-info", {{"detail", std::move(err)}});
    }
    const auto it = infos.find(std::string(storePath));
    if (it == infos.end()) {
      throw Error(ErrorKind::BuildOutput, "nix path-info did not describe the store path",
                  {{"path", std::string(storePath)}});
    }
    narHash = std::move(it->second.narHash);
  } else {
    std::vector<PathInfo> infos;
    if (auto err = ParseJson(json, infos); !err.empty()) {
      throw Error(ErrorKind::BuildOutput, "invalid JSON from nix path-info", {{"detail", std::move(err)}});
    }
    if (infos.empty()) {
      throw Error(ErrorKind::BuildOutput, "nix path-info returned no result", {{"path", std::string(storePath)}});
    }
    narHash = std::move(infos.front().narHash);
  }
  if (narHash.empty()) {
    throw Error(ErrorKind::BuildOutput, "nix path-info returned no narHash", {{"path", std::string(storePath)}});
  }
  return narHash;
}

}  // namespace snowweb
