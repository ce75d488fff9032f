#include "snowweb/cli-options.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <initializer_list>
#include <string>
#include <vector>

#include "snowweb/error.hpp"
#include "snowweb/scoped-env-var.hpp"

namespace snowweb {

namespace {

CliOptions Parse(std::initializer_list<const char*> args) {
  std::vector<const char*> argv{"snowweb"};
  argv.insert(argv.end(), args.begin(), args.end());
  return ParseCliOptions(static_cast<int>(argv.size()), argv.data());
}

void ExpectUsageError(std::initializer_list<const char*> args, const std::string& fragment) {
  try {
    (void)Parse(args);
    FAIL() << "expected a usage error containing '" << fragment << "'";
  } catch (const Error& ex) {
    EXPECT_EQ(ex.kind(), ErrorKind::Usage);
    EXPECT_TRUE(FormatErrorChain(ex).contains(fragment)) << FormatErrorChain(ex);
  }
}

}  // namespace

TEST(CliOptionsTest, Defaults) {
  const auto options = Parse({".#site"});
  EXPECT_EQ(options.installable, ".#site");
  EXPECT_EQ(options.listen, "tcp:[::1]:");
  EXPECT_EQ(options.logSink, "stderr");
  EXPECT_EQ(options.logLevel, "info");
  EXPECT_EQ(options.builder, "nix");
  EXPECT_EQ(options.reloadFailureStatus, 200);
  EXPECT_EQ(options.drainTimeout, std::chrono::seconds(30));
  EXPECT_FALSE(options.tlsEnabled());
  EXPECT_FALSE(options.help);
  EXPECT_EQ(options.acmeCa, AcmeConfig::kLetsEncryptProductionDirectory);
}

TEST(CliOptionsTest, CommandLine) {
  const auto options =
      Parse({"--listen", "unix:/run/snowweb.sock", "--log", "syslog", "--log-level", "debug", "--certificate",
             "cert.pem", "--key", "key.pem", "--client-ca", "ca.pem", "--builder", "directory", "--watch", "a",
             "--watch", "b", "--reload-failure-status", "500", "--drain-timeout", "5", "/srv/site"});
  EXPECT_EQ(options.installable, "/srv/site");
  EXPECT_EQ(options.listen, "unix:/run/snowweb.sock");
  EXPECT_EQ(options.logSink, "syslog");
  EXPECT_EQ(options.logLevel, "debug");
  EXPECT_TRUE(options.fileTls());
  EXPECT_FALSE(options.acmeTls());
  EXPECT_EQ(options.clientCa, "ca.pem");
  EXPECT_EQ(options.builder, "directory");
  EXPECT_EQ(options.watchPaths, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(options.reloadFailureStatus, 500);
  EXPECT_EQ(options.drainTimeout, std::chrono::seconds(5));
}

TEST(CliOptionsTest, Environment) {
  test::ScopedEnvVar listen("SNOWWEB_LISTEN", "tcp:0.0.0.0:8080");
  test::ScopedEnvVar level("SNOWWEB_LOG_LEVEL", "warn");
  test::ScopedEnvVar profile("SNOWWEB_PROFILE", "/nix/var/nix/profiles/site");
  test::ScopedEnvVar status("SNOWWEB_RELOAD_FAILURE_STATUS", "500");
  test::ScopedEnvVar drain("SNOWWEB_DRAIN_TIMEOUT", "0");
  test::ScopedEnvVar unrelated("SNOWWEB_UNKNOWN_SETTING", "ignored");
  const auto options = Parse({".#site"});
  EXPECT_EQ(options.listen, "tcp:0.0.0.0:8080");
  EXPECT_EQ(options.logLevel, "warn");
  EXPECT_EQ(options.profile, "/nix/var/nix/profiles/site");
  EXPECT_EQ(options.reloadFailureStatus, 500);
  EXPECT_EQ(options.drainTimeout, std::chrono::seconds(0));
}

TEST(CliOptionsTest, CommandLineOverridesEnvironment) {
  test::ScopedEnvVar listen("SNOWWEB_LISTEN", "tcp:0.0.0.0:8080");
  test::ScopedEnvVar builder("SNOWWEB_BUILDER", "directory");
  const auto options = Parse({"--listen", "fd:3", ".#site"});
  EXPECT_EQ(options.listen, "fd:3");
  EXPECT_EQ(options.builder, "directory");
}

TEST(CliOptionsTest, AcmeDomains) {
  {
    test::ScopedEnvVar domains("SNOWWEB_TLS_ACME_DOMAINS", " example.org  www.example.org ");
    test::ScopedEnvVar email("SNOWWEB_TLS_ACME_EMAIL", "ops@example.org");
    const auto options = Parse({".#site"});
    EXPECT_TRUE(options.acmeTls());
    EXPECT_EQ(options.acmeDomains, (std::vector<std::string>{"example.org", "www.example.org"}));

    const auto acme = options.acmeConfig();
    EXPECT_EQ(acme.domains, options.acmeDomains);
    EXPECT_EQ(acme.email, "ops@example.org");
    EXPECT_EQ(acme.client, "lego");

    // repeated flags replace the environment list
    const auto overridden = Parse({"--acme-domain", "a.test", "--acme-domain", "b.test", ".#site"});
    EXPECT_EQ(overridden.acmeDomains, (std::vector<std::string>{"a.test", "b.test"}));
  }
  const auto options = Parse({"--acme-domain", "a.test", "--acme-client", "/bin/lego",
                              "--acme-client-arg=--dns=rfc2136", "--acme-ca", "https://acme.test/dir", ".#site"});
  const auto acme = options.acmeConfig();
  EXPECT_EQ(acme.client, "/bin/lego");
  EXPECT_EQ(acme.extraArgs, (std::vector<std::string>{"--dns=rfc2136"}));
  EXPECT_EQ(acme.directoryUrl, "https://acme.test/dir");
}

TEST(CliOptionsTest, HelpDoesNotRequireInstallable) {
  EXPECT_TRUE(Parse({"--help"}).help);
  EXPECT_TRUE(Parse({"-h"}).help);
}

TEST(CliOptionsTest, UsageErrors) {
  ExpectUsageError({}, "missing installable");
  ExpectUsageError({"a", "b"}, "exactly one installable");
  ExpectUsageError({"--certificate", "cert.pem", "site"}, "together");
  ExpectUsageError({"--key", "key.pem", "site"}, "together");
  ExpectUsageError({"--certificate", "c", "--key", "k", "--acme-domain", "a.test", "site"}, "mutually exclusive");
  ExpectUsageError({"--client-ca", "ca.pem", "site"}, "requires TLS");
  ExpectUsageError({"--builder", "make", "site"}, "unknown builder");
  ExpectUsageError({"--log", "file", "site"}, "unknown log destination");
  ExpectUsageError({"--log-level", "chatty", "site"}, "unknown log level");
  ExpectUsageError({"--reload-failure-status", "404", "site"}, "200 or 500");
  ExpectUsageError({"--reload-failure-status", "lots", "site"}, "invalid arguments");
  ExpectUsageError({"--drain-timeout=soon", "site"}, "invalid arguments");
  ExpectUsageError({"--no-such-flag", "site"}, "invalid arguments");
}

TEST(CliOptionsTest, InvalidEnvironmentIsUsageError) {
  test::ScopedEnvVar status("SNOWWEB_RELOAD_FAILURE_STATUS", "soon");
  ExpectUsageError({"site"}, "invalid arguments");
}

TEST(CliOptionsTest, UsageListsOptions) {
  const auto usage = CliUsage("snowweb");
  EXPECT_TRUE(usage.starts_with("Usage: snowweb [options] <installable>"));
  for (const char* flag : {"--listen", "--certificate", "--client-ca", "--acme-domain", "--builder", "--watch",
                           "--reload-failure-status", "SNOWWEB_TLS_ACME_DOMAINS"}) {
    EXPECT_TRUE(usage.contains(flag)) << flag;
  }
}

}  // namespace snowweb
