#include <sysexits.h>

#include <exception>
#include <iostream>

#include "snowweb/cli-options.hpp"
#include "snowweb/error.hpp"
#include "snowweb/log-setup.hpp"
#include "snowweb/snowweb-app.hpp"

int main(int argc, char** argv) {
  const char* programName = argc > 0 ? argv[0] : "snowweb";
  snowweb::CliOptions options;
  try {
    options = snowweb::ParseCliOptions(argc, argv);
  } catch (const snowweb::Error& ex) {
    std::cerr << programName << ": " << snowweb::FormatErrorChain(ex) << "\n\n" << snowweb::CliUsage(programName);
    return EX_USAGE;
  }
  if (options.help) {
    std::cout << snowweb::CliUsage(programName);
    return EX_OK;
  }

  // both were validated by ParseCliOptions
  snowweb::SetupLogging(*snowweb::ParseLogSink(options.logSink), *snowweb::ParseLogLevel(options.logLevel));

  return snowweb::RunSnowweb(options);
}
