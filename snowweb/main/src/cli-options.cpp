#include "snowweb/cli-options.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "snowweb/error.hpp"
#include "snowweb/log-setup.hpp"

namespace snowweb {

namespace po = boost::program_options;

namespace {

struct EnvironmentOption {
  std::string_view variable;
  std::string_view option;
};

constexpr EnvironmentOption kEnvironmentOptions[] = {
    {"SNOWWEB_LISTEN", "listen"},
    {"SNOWWEB_LOG", "log"},
    {"SNOWWEB_LOG_LEVEL", "log-level"},
    {"SNOWWEB_TLS_CERTIFICATE", "certificate"},
    {"SNOWWEB_TLS_KEY", "key"},
    {"SNOWWEB_TLS_CLIENT_CA", "client-ca"},
    {"SNOWWEB_TLS_ACME_DOMAINS", "acme-domains"},
    {"SNOWWEB_TLS_ACME_CA", "acme-ca"},
    {"SNOWWEB_TLS_ACME_CA_ROOTS", "acme-ca-roots"},
    {"SNOWWEB_TLS_ACME_EMAIL", "acme-email"},
    {"SNOWWEB_TLS_ACME_STORAGE", "acme-storage"},
    {"SNOWWEB_BUILDER", "builder"},
    {"SNOWWEB_PROFILE", "profile"},
    {"SNOWWEB_RELOAD_FAILURE_STATUS", "reload-failure-status"},
    {"SNOWWEB_DRAIN_TIMEOUT", "drain-timeout"},
};

// Options settable both from the command line and from the environment.
void AddSharedOptions(po::options_description& desc) {
  desc.add_options()
      // listener
      ("listen", po::value<std::string>()->value_name("<network>:<address>"),
       "listening address: tcp:<host>:<port>, unix:<path>, fd:<n> or systemd:<name> (SNOWWEB_LISTEN, default "
       "tcp:[::1]:)")
      // logging
      ("log", po::value<std::string>()->value_name("<sink>"),
       "log destination: stderr, stdout or syslog (SNOWWEB_LOG, default stderr)")
      ("log-level", po::value<std::string>()->value_name("<level>"),
       "minimum log level: trace, debug, info, warn, error, critical or off (SNOWWEB_LOG_LEVEL, default info)")
      // TLS
      ("certificate", po::value<std::string>()->value_name("<file>"),
       "PEM certificate chain, enables TLS (SNOWWEB_TLS_CERTIFICATE)")
      ("key", po::value<std::string>()->value_name("<file>"), "PEM private key (SNOWWEB_TLS_KEY)")
      ("client-ca", po::value<std::string>()->value_name("<file>"),
       "PEM bundle of client certificate roots, required for remote reload (SNOWWEB_TLS_CLIENT_CA)")
      ("acme-ca", po::value<std::string>()->value_name("<url>"), "ACME directory URL (SNOWWEB_TLS_ACME_CA)")
      ("acme-ca-roots", po::value<std::string>()->value_name("<file>"),
       "roots trusted for the ACME directory (SNOWWEB_TLS_ACME_CA_ROOTS)")
      ("acme-email", po::value<std::string>()->value_name("<address>"),
       "ACME account email (SNOWWEB_TLS_ACME_EMAIL)")
      ("acme-storage", po::value<std::string>()->value_name("<dir>"),
       "ACME account and certificate storage (SNOWWEB_TLS_ACME_STORAGE)")
      // content
      ("builder", po::value<std::string>()->value_name("<name>"),
       "how the installable is built: nix or directory (SNOWWEB_BUILDER, default nix)")
      ("profile", po::value<std::string>()->value_name("<path>"),
       "nix profile updated by each build (SNOWWEB_PROFILE)")
      ("reload-failure-status", po::value<int>()->value_name("<status>"),
       "status of a failed remote reload: 200 or 500 (SNOWWEB_RELOAD_FAILURE_STATUS, default 200)")
      ("drain-timeout", po::value<unsigned>()->value_name("<seconds>"),
       "maximum time given to in-flight requests on shutdown (SNOWWEB_DRAIN_TIMEOUT, default 30)");
}

po::options_description CommandLineOptions() {
  po::options_description desc("Options");
  desc.add_options()("help,h", "print this help and exit");
  AddSharedOptions(desc);
  desc.add_options()
      ("acme-domain", po::value<std::vector<std::string>>()->value_name("<domain>"),
       "obtain the certificate from ACME for this domain, repeatable (SNOWWEB_TLS_ACME_DOMAINS, space separated)")
      ("acme-client", po::value<std::string>()->value_name("<executable>"), "lego compatible ACME client")
      ("acme-client-arg", po::value<std::vector<std::string>>()->value_name("<arg>"),
       "extra ACME client argument, repeatable")
      ("watch", po::value<std::vector<std::string>>()->value_name("<path>"),
       "rebuild when this file is written, repeatable");
  return desc;
}

po::options_description EnvironmentOptions() {
  po::options_description desc;
  AddSharedOptions(desc);
  desc.add_options()("acme-domains", po::value<std::string>());
  return desc;
}

std::string EnvironmentToOption(const std::string& variable) {
  for (const auto& entry : kEnvironmentOptions) {
    if (entry.variable == variable) {
      return std::string(entry.option);
    }
  }
  return {};
}

std::vector<std::string> SplitWords(std::string_view text) {
  std::vector<std::string> words;
  std::istringstream stream{std::string(text)};
  for (std::string word; stream >> word;) {
    words.push_back(std::move(word));
  }
  return words;
}

[[noreturn]] void ThrowUsage(const std::string& message) { throw Error(ErrorKind::Usage, message); }

template <class T>
void Assign(const po::variables_map& vm, const char* name, T& out) {
  if (vm.count(name) != 0) {
    out = vm[name].as<T>();
  }
}

void Validate(const CliOptions& options) {
  if (options.installable.empty()) {
    ThrowUsage("missing installable");
  }
  if (options.certificate.empty() != options.key.empty()) {
    ThrowUsage("--certificate and --key must be given together");
  }
  if (options.fileTls() && options.acmeTls()) {
    ThrowUsage("--certificate/--key and --acme-domain are mutually exclusive");
  }
  if (!options.clientCa.empty() && !options.tlsEnabled()) {
    ThrowUsage("--client-ca requires TLS");
  }
  if (options.builder != "nix" && options.builder != "directory") {
    ThrowUsage("unknown builder '" + options.builder + "'");
  }
  if (!ParseLogSink(options.logSink)) {
    ThrowUsage("unknown log destination '" + options.logSink + "'");
  }
  if (!ParseLogLevel(options.logLevel)) {
    ThrowUsage("unknown log level '" + options.logLevel + "'");
  }
}

}  // namespace

AcmeConfig CliOptions::acmeConfig() const {
  return AcmeConfig{}
      .withDomains(acmeDomains)
      .withDirectoryUrl(acmeCa)
      .withCaRootsPath(acmeCaRoots)
      .withEmail(acmeEmail)
      .withStoragePath(acmeStorage)
      .withClient(acmeClient)
      .withExtraArgs(acmeClientArgs);
}

CliOptions ParseCliOptions(int argc, const char* const* argv) {
  po::options_description visible = CommandLineOptions();
  po::options_description all;
  all.add(visible).add_options()("installable", po::value<std::vector<std::string>>());
  po::positional_options_description positional;
  positional.add("installable", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::store(po::parse_environment(EnvironmentOptions(), EnvironmentToOption), vm);
    po::notify(vm);
  } catch (const po::error&) {
    ThrowWithCause(ErrorKind::Usage, "invalid arguments");
  }

  CliOptions options;
  options.help = vm.count("help") != 0;
  if (vm.count("installable") != 0) {
    const auto& installables = vm["installable"].as<std::vector<std::string>>();
    if (installables.size() > 1) {
      ThrowUsage("exactly one installable expected, got " + std::to_string(installables.size()));
    }
    options.installable = installables.front();
  }
  Assign(vm, "listen", options.listen);
  Assign(vm, "log", options.logSink);
  Assign(vm, "log-level", options.logLevel);
  Assign(vm, "certificate", options.certificate);
  Assign(vm, "key", options.key);
  Assign(vm, "client-ca", options.clientCa);
  Assign(vm, "acme-domain", options.acmeDomains);
  if (options.acmeDomains.empty() && vm.count("acme-domains") != 0) {
    options.acmeDomains = SplitWords(vm["acme-domains"].as<std::string>());
  }
  Assign(vm, "acme-ca", options.acmeCa);
  Assign(vm, "acme-ca-roots", options.acmeCaRoots);
  Assign(vm, "acme-email", options.acmeEmail);
  Assign(vm, "acme-storage", options.acmeStorage);
  Assign(vm, "acme-client", options.acmeClient);
  Assign(vm, "acme-client-arg", options.acmeClientArgs);
  Assign(vm, "builder", options.builder);
  Assign(vm, "profile", options.profile);
  Assign(vm, "watch", options.watchPaths);
  if (vm.count("reload-failure-status") != 0) {
    const int status = vm["reload-failure-status"].as<int>();
    if (status != http::StatusCodeOK && status != http::StatusCodeInternalServerError) {
      ThrowUsage("--reload-failure-status must be 200 or 500");
    }
    options.reloadFailureStatus = static_cast<http::StatusCode>(status);
  }
  if (vm.count("drain-timeout") != 0) {
    options.drainTimeout = std::chrono::seconds(vm["drain-timeout"].as<unsigned>());
  }

  if (!options.help) {
    Validate(options);
  }
  return options;
}

std::string CliUsage(std::string_view programName) {
  std::ostringstream out;
  out << "Usage: " << programName << " [options] <installable>\n\n"
      << "Serves the tree built from <installable> over HTTP or HTTPS.\n"
      << "SIGUSR1 rebuilds the content, SIGUSR2 reloads the TLS certificate, SIGHUP does both.\n\n"
      << CommandLineOptions();
  return out.str();
}

}  // namespace snowweb
