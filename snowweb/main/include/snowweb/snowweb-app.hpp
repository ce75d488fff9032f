#pragma once

#include <exception>
#include <memory>

#include "snowweb/cli-options.hpp"
#include "snowweb/http-server-config.hpp"
#include "snowweb/site-builder.hpp"

namespace snowweb {

// Maps a startup failure to a <sysexits.h> status, from the kind of the outermost snowweb::Error of its chain.
[[nodiscard]] int ExitStatusFor(const std::exception& ex) noexcept;

[[nodiscard]] std::unique_ptr<SiteBuilder> MakeSiteBuilder(const CliOptions& options);

[[nodiscard]] HttpServerConfig MakeServerConfig(const CliOptions& options);

// Sets up listener, TLS and content, then serves until SIGINT or SIGTERM and drains.
// Must be called before any other thread is started. Returns the process exit status.
[[nodiscard]] int RunSnowweb(const CliOptions& options);

}  // namespace snowweb
