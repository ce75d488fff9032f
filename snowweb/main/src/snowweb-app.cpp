#include "snowweb/snowweb-app.hpp"

#include <sysexits.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "snowweb/certificate-authority.hpp"
#include "snowweb/directory-builder.hpp"
#include "snowweb/error.hpp"
#include "snowweb/file.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-server.hpp"
#include "snowweb/listener-address.hpp"
#include "snowweb/log.hpp"
#include "snowweb/nix-builder.hpp"
#include "snowweb/reload-event-loop.hpp"
#include "snowweb/reload-trigger.hpp"
#include "snowweb/site-coordinator.hpp"
#include "snowweb/socket.hpp"
#include "snowweb/tls-context.hpp"
#include "snowweb/tls-material-manager.hpp"

namespace snowweb {

namespace {

struct TlsSetup {
  std::shared_ptr<TlsMaterialManager> manager;
  std::shared_ptr<const TlsContext> context;
};

std::unique_ptr<TlsMaterialSource> MakeMaterialSource(const CliOptions& options) {
  if (options.fileTls()) {
    return std::make_unique<FileMaterialSource>(options.certificate, options.key);
  }
  std::unique_ptr<CertificateAuthority> authority;
  try {
    authority = std::make_unique<AcmeClientAuthority>(options.acmeConfig());
  } catch (const std::invalid_argument&) {
    ThrowWithCause(ErrorKind::Usage, "invalid ACME configuration");
  }
  return std::make_unique<AuthorityMaterialSource>(std::move(authority));
}

std::string ReadClientCa(const std::string& path) {
  try {
    std::error_code ec;
    const File file = File::Open(path, ec);
    if (ec) {
      throw std::system_error(ec, "unable to open '" + path + "'");
    }
    return file.loadAllContent();
  } catch (const std::exception&) {
    ThrowWithCause(ErrorKind::TlsMaterial, "unable to read client CA bundle", {{"path", path}});
  }
}

// Empty for plain HTTP. Sets 'exitStatus' to EX_DATAERR if the client CA bundle cannot be parsed.
TlsSetup SetupTls(const CliOptions& options, int& exitStatus) {
  TlsSetup setup;
  if (!options.tlsEnabled()) {
    return setup;
  }
  setup.manager = std::make_shared<TlsMaterialManager>(MakeMaterialSource(options));
  log::info("TLS enabled with material from {}", setup.manager->source().describe());
  if (options.clientCa.empty()) {
    setup.context = std::make_shared<const TlsContext>(setup.manager);
    return setup;
  }
  const std::string clientCaPem = ReadClientCa(options.clientCa);
  try {
    setup.context = std::make_shared<const TlsContext>(setup.manager, clientCaPem);
  } catch (const std::runtime_error& ex) {
    log::critical("Unusable client CA bundle '{}': {}", options.clientCa, ex.what());
    exitStatus = EX_DATAERR;
    return setup;
  }
  log::info("Client certificates verified against '{}'", options.clientCa);
  return setup;
}

int Serve(const CliOptions& options) {
  Socket listener = ResolveListener(ParseListenerAddress(options.listen));

  int exitStatus = EX_OK;
  TlsSetup tls = SetupTls(options, exitStatus);
  if (exitStatus != EX_OK) {
    return exitStatus;
  }

  SiteCoordinator coordinator(options.installable, MakeSiteBuilder(options),
                              SiteCoordinatorConfig{}.withReloadFailureStatus(options.reloadFailureStatus));
  (void)coordinator.rebuild();

  ReloadEventLoopConfig loopConfig;
  loopConfig.rebuildWatchPaths = options.watchPaths;
  ReloadEventLoop controlLoop(std::move(loopConfig), coordinator, tls.manager.get());

  HttpServer server(
      MakeServerConfig(options), std::move(listener),
      [&coordinator](const HttpRequest& request) { return coordinator(request); }, tls.context);

  std::exception_ptr serverFailure;
  std::jthread serverThread([&server, &serverFailure, &controlLoop] {
    try {
      server.run();
    } catch (const std::exception& ex) {
      log::critical("Server failed: {}", FormatErrorChain(ex));
      serverFailure = std::current_exception();
      controlLoop.requestShutdown();
    }
  });

  try {
    (void)controlLoop.run();
  } catch (...) {
    server.stop();
    serverThread.join();
    throw;
  }

  log::info("Draining connections for at most {}s", options.drainTimeout.count());
  server.stop();
  serverThread.join();
  if (serverFailure) {
    std::rethrow_exception(serverFailure);
  }
  return EX_OK;
}

}  // namespace

int ExitStatusFor(const std::exception& ex) noexcept {
  const auto kind = FindErrorKind(ex);
  if (!kind) {
    return EX_SOFTWARE;
  }
  switch (*kind) {
    case ErrorKind::Usage:
    case ErrorKind::ListenerParse:
      return EX_USAGE;
    case ErrorKind::ListenerLookup:
    case ErrorKind::NoSocketsPassed:
    case ErrorKind::Io:
    case ErrorKind::Build:
    case ErrorKind::BuildOutput:
      return EX_UNAVAILABLE;
    case ErrorKind::TlsMaterial:
    case ErrorKind::CertificateAuthority:
      return EX_NOINPUT;
    case ErrorKind::Watch:
      return EX_OSERR;
    default:
      return EX_SOFTWARE;
  }
}

std::unique_ptr<SiteBuilder> MakeSiteBuilder(const CliOptions& options) {
  if (options.builder == "directory") {
    return std::make_unique<DirectoryBuilder>();
  }
  return std::make_unique<NixBuilder>(NixBuilderConfig{}.withProfile(options.profile));
}

HttpServerConfig MakeServerConfig(const CliOptions& options) {
  return HttpServerConfig{}.withDrainTimeout(options.drainTimeout);
}

int RunSnowweb(const CliOptions& options) {
  try {
    return Serve(options);
  } catch (const std::exception& ex) {
    const int status = ExitStatusFor(ex);
    log::critical("{} (exit status {})", FormatErrorChain(ex), status);
    return status;
  }
}

}  // namespace snowweb
