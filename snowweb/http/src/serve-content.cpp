#include "snowweb/serve-content.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>

#include "snowweb/file.hpp"
#include "snowweb/http-constants.hpp"
#include "snowweb/http-method.hpp"
#include "snowweb/http-request.hpp"
#include "snowweb/http-response.hpp"
#include "snowweb/http-status-code.hpp"
#include "snowweb/string-equal-ignore-case.hpp"
#include "snowweb/string-trim.hpp"

namespace snowweb {

namespace {

struct RangeSelection {
  enum class State : std::uint8_t { None, Valid, Invalid, Unsatisfiable };

  State state{State::None};
  std::uint64_t offset{0};
  std::uint64_t length{0};
};

inline constexpr std::uint64_t kInvalidUint64 = std::numeric_limits<std::uint64_t>::max();

[[nodiscard]] std::uint64_t ParseUint(std::string_view token) {
  token = TrimOws(token);
  if (token.empty()) {
    return kInvalidUint64;
  }
  std::uint64_t value;
  const auto* last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return kInvalidUint64;
  }
  return value;
}

[[nodiscard]] RangeSelection ParseRangeSpec(std::string_view spec, std::uint64_t fileSize) {
  RangeSelection result;
  spec = TrimOws(spec);
  const auto dashPos = spec.find('-');
  if (dashPos == std::string_view::npos) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  const auto firstPart = TrimOws(spec.substr(0, dashPos));
  const auto secondPart = TrimOws(spec.substr(dashPos + 1));

  if (firstPart.empty()) {
    // bytes=-N: last N bytes
    const auto suffixLen = ParseUint(secondPart);
    if (suffixLen == kInvalidUint64) {
      result.state = RangeSelection::State::Invalid;
      return result;
    }
    if (suffixLen == 0 || fileSize == 0) {
      result.state = RangeSelection::State::Unsatisfiable;
      return result;
    }
    const std::uint64_t len = std::min(suffixLen, fileSize);
    result.offset = fileSize - len;
    result.length = len;
    result.state = RangeSelection::State::Valid;
    return result;
  }

  const auto firstValue = ParseUint(firstPart);
  const auto secondValue = secondPart.empty() ? fileSize - 1 : ParseUint(secondPart);
  if (firstValue == kInvalidUint64 || (!secondPart.empty() && secondValue == kInvalidUint64)) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  if (!secondPart.empty() && secondValue < firstValue) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  if (firstValue >= fileSize) {
    result.state = RangeSelection::State::Unsatisfiable;
    return result;
  }
  const std::uint64_t endInclusive = std::min(secondValue, fileSize - 1);
  result.offset = firstValue;
  result.length = endInclusive - firstValue + 1;
  result.state = RangeSelection::State::Valid;
  return result;
}

// Unsatisfiable members of a range set are skipped. A set left with several satisfiable ranges selects the whole
// representation (State::None), as multipart/byteranges bodies are not produced.
[[nodiscard]] RangeSelection ParseRange(std::string_view raw, std::uint64_t fileSize) {
  RangeSelection result;
  raw = TrimOws(raw);
  static constexpr std::string_view kBytesEqual = "bytes=";
  if (!StartsWithCaseInsensitive(raw, kBytesEqual)) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  raw.remove_prefix(kBytesEqual.size());

  int nbSatisfiable = 0;
  bool sawSpec = false;
  while (true) {
    const auto comma = raw.find(',');
    const std::string_view spec = TrimOws(raw.substr(0, comma));
    // empty list elements are allowed by the list syntax
    if (!spec.empty()) {
      sawSpec = true;
      const RangeSelection one = ParseRangeSpec(spec, fileSize);
      if (one.state == RangeSelection::State::Invalid) {
        return one;
      }
      if (one.state == RangeSelection::State::Valid && ++nbSatisfiable == 1) {
        result = one;
      }
    }
    if (comma == std::string_view::npos) {
      break;
    }
    raw.remove_prefix(comma + 1);
  }

  if (!sawSpec) {
    result.state = RangeSelection::State::Invalid;
  } else if (nbSatisfiable == 0) {
    result.state = RangeSelection::State::Unsatisfiable;
  } else if (nbSatisfiable > 1) {
    result = RangeSelection{};
  }
  return result;
}

// Strips the weakness indicator of an entity tag.
[[nodiscard]] std::string_view Opaque(std::string_view tag) {
  if (tag.starts_with("W/")) {
    tag.remove_prefix(2);
  }
  return tag;
}

// 'weak' selects the weak comparison function of RFC 9110 §8.8.3.2 (If-None-Match), otherwise strong (If-Match).
[[nodiscard]] bool EtagListMatches(std::string_view headerValue, std::string_view etag, bool weak) {
  headerValue = TrimOws(headerValue);
  if (headerValue == "*") {
    return true;
  }
  while (!headerValue.empty()) {
    const auto commaPos = headerValue.find(',');
    const auto token = TrimOws(headerValue.substr(0, commaPos));
    if (weak) {
      if (!token.empty() && Opaque(token) == Opaque(etag)) {
        return true;
      }
    } else if (!token.starts_with("W/") && token == etag) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(commaPos + 1);
  }
  return false;
}

enum class ConditionalOutcome : std::uint8_t { None, NotModified, PreconditionFailed };

[[nodiscard]] ConditionalOutcome EvaluateConditionals(const HttpRequest& request, std::string_view etag) {
  if (auto ifMatch = request.headerValue(http::IfMatch); ifMatch) {
    if (!EtagListMatches(*ifMatch, etag, false)) {
      return ConditionalOutcome::PreconditionFailed;
    }
  }
  if (auto ifNoneMatch = request.headerValue(http::IfNoneMatch); ifNoneMatch) {
    if (EtagListMatches(*ifNoneMatch, etag, true)) {
      const bool isGetOrHead = request.method() == http::Method::GET || request.method() == http::Method::HEAD;
      return isGetOrHead ? ConditionalOutcome::NotModified : ConditionalOutcome::PreconditionFailed;
    }
  }
  return ConditionalOutcome::None;
}

// Only strong entity tags are honored; a date (or weak tag) makes the Range header ignored.
[[nodiscard]] bool IfRangeAllowsPartial(std::string_view value, std::string_view etag) {
  value = TrimOws(value);
  return !value.empty() && value.front() == '"' && value == etag;
}

void DropRepresentationHeaders(HttpResponse& response) {
  response.removeHeader(http::ContentType);
  response.removeHeader(http::ContentEncoding);
}

}  // namespace

void ServeContent(const HttpRequest& request, File file, std::string_view etag, HttpResponse& response) {
  const std::uint64_t fileSize = file.size();

  switch (EvaluateConditionals(request, etag)) {
    case ConditionalOutcome::PreconditionFailed:
      response.status(http::StatusCodePreconditionFailed);
      response.body({}, {});
      return;
    case ConditionalOutcome::NotModified:
      response.status(http::StatusCodeNotModified);
      DropRepresentationHeaders(response);
      response.body({}, {});
      return;
    case ConditionalOutcome::None:
      break;
  }

  RangeSelection range;
  if (auto rangeHeader = request.headerValue(http::Range); rangeHeader) {
    bool allowed = true;
    if (auto ifRange = request.headerValue(http::IfRange); ifRange) {
      allowed = IfRangeAllowsPartial(*ifRange, etag);
    }
    if (allowed) {
      range = ParseRange(*rangeHeader, fileSize);
    }
  }

  switch (range.state) {
    case RangeSelection::State::Invalid:
      [[fallthrough]];
    case RangeSelection::State::Unsatisfiable:
      response.status(http::StatusCodeRangeNotSatisfiable);
      DropRepresentationHeaders(response);
      response.header(http::ContentRange, std::format("bytes */{}", fileSize));
      response.body({}, {});
      return;
    case RangeSelection::State::Valid:
      response.status(http::StatusCodePartialContent);
      response.header(http::ContentRange, std::format("bytes {}-{}/{}", range.offset,
                                                      range.offset + range.length - 1, fileSize));
      response.file(std::move(file), static_cast<std::size_t>(range.offset), static_cast<std::size_t>(range.length));
      return;
    case RangeSelection::State::None:
      break;
  }

  response.status(http::StatusCodeOK);
  response.file(std::move(file));
}

}  // namespace snowweb
