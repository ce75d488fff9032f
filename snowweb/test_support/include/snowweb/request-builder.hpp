#pragma once

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "snowweb/http-request.hpp"
#include "snowweb/http-status-code.hpp"

namespace snowweb::test {

using HeaderInit = std::initializer_list<std::pair<std::string_view, std::string_view>>;

// Builds a request the way the server would receive it, going through ParseRequestHead.
inline HttpRequest MakeRequest(std::string_view method, std::string_view target, HeaderInit headers = {}) {
  std::string head;
  head.append(method).append(" ").append(target).append(" HTTP/1.1\r\nHost: test");
  for (const auto& [name, value] : headers) {
    head.append("\r\n").append(name).append(": ").append(value);
  }
  HttpRequest request;
  if (ParseRequestHead(head, request) != http::StatusCodeOK) {
    throw std::invalid_argument("invalid test request head: " + head);
  }
  return request;
}

}  // namespace snowweb::test
