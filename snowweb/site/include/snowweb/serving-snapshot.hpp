#pragma once

#include <string>

#include "snowweb/content-server.hpp"
#include "snowweb/http-header.hpp"

namespace snowweb {

// Everything a request needs to be answered from one build. Published as std::shared_ptr<const ServingSnapshot>:
// a request loads it once and keeps it alive until its response is sent.
struct ServingSnapshot {
  std::string installable;
  ContentServer contentServer;
  // Site specific headers (".snowweb/headers" of the tree) added to every response.
  http::HeaderList extraHeaders;
};

}  // namespace snowweb
