#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "snowweb/content-root.hpp"
#include "snowweb/site-builder.hpp"

namespace snowweb {

struct NixBuilderConfig {
  // Nix executable, looked up in PATH.
  std::string command{"nix"};

  // Optional profile updated by each successful build ("nix build --profile").
  std::string profile;

  NixBuilderConfig& withCommand(std::string_view executable);

  NixBuilderConfig& withProfile(std::string_view profilePath);
};

// Builds installables with "nix build" and identifies the output by its NAR hash ("nix path-info").
// Standard error of nix is inherited, so build logs go to the server's stderr.
class NixBuilder final : public SiteBuilder {
 public:
  explicit NixBuilder(NixBuilderConfig config = {});

  // Throws Error{Build} if a nix command cannot be run or exits with a non zero status,
  // Error{BuildOutput} if its output cannot be understood.
  [[nodiscard]] ContentRoot build(std::string_view installable) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "nix"; }

  [[nodiscard]] std::vector<std::string> buildCommand(std::string_view installable) const;

  [[nodiscard]] std::vector<std::string> pathInfoCommand(std::string_view storePath) const;

 private:
  [[nodiscard]] std::string run(const std::vector<std::string>& argv) const;

  NixBuilderConfig _config;
};

// Extracts the "out" output path from the JSON output of "nix build --json".
// Throws Error{BuildOutput} on unexpected output.
[[nodiscard]] std::string ParseBuildOutput(const std::string& json);

// Extracts the NAR hash of 'storePath' from the JSON output of "nix path-info --json", accepting both the list
// format and the newer object format keyed by store path.
// Throws Error{BuildOutput} on unexpected output.
[[nodiscard]] std::string ParseNarHash(const std::string& json, std::string_view storePath);

}  // namespace snowweb
