#include "snowweb/content-negotiation.hpp"

#include <charconv>
#include <initializer_list>
#include <string_view>
#include <system_error>

#include "snowweb/string-equal-ignore-case.hpp"
#include "snowweb/string-trim.hpp"

namespace snowweb::http {

namespace {

struct AcceptItem {
  std::string_view value;
  double q{1.0};
};

// Parses one comma separated element "value;param;q=0.5". Invalid q-values count as 0.
AcceptItem ParseAcceptItem(std::string_view element) {
  AcceptItem item;
  const auto semi = element.find(';');
  item.value = TrimOws(element.substr(0, semi));
  if (semi == std::string_view::npos) {
    return item;
  }
  std::string_view params = element.substr(semi + 1);
  while (!params.empty()) {
    const auto next = params.find(';');
    const auto param = TrimOws(params.substr(0, next));
    if (param.size() > 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
      const auto qStr = param.substr(2);
      double q = 0;
      const auto [ptr, ec] = std::from_chars(qStr.data(), qStr.data() + qStr.size(), q);
      item.q = (ec != std::errc{} || ptr != qStr.data() + qStr.size() || q < 0 || q > 1) ? 0 : q;
    }
    if (next == std::string_view::npos) {
      break;
    }
    params.remove_prefix(next + 1);
  }
  return item;
}

template <class Func>
void ForEachAcceptItem(std::string_view header, Func&& func) {
  while (!header.empty()) {
    const auto comma = header.find(',');
    const auto item = ParseAcceptItem(header.substr(0, comma));
    if (!item.value.empty()) {
      func(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    header.remove_prefix(comma + 1);
  }
}

// 0 for an exact media type, 1 for "type/*", 2 for "*/*", -1 if the range does not cover 'offer'.
int Wildness(std::string_view range, std::string_view offer) {
  if (range == "*/*") {
    return 2;
  }
  if (range.ends_with("/*")) {
    const auto slash = offer.find('/');
    return slash != std::string_view::npos && CaseInsensitiveEqual(range.substr(0, range.size() - 1),
                                                                   offer.substr(0, slash + 1))
               ? 1
               : -1;
  }
  return CaseInsensitiveEqual(range, offer) ? 0 : -1;
}

}  // namespace

std::string_view NegotiateContentType(std::string_view accept, std::initializer_list<std::string_view> offers) {
  accept = TrimOws(accept);
  if (accept.empty()) {
    return offers.size() == 0 ? std::string_view{} : *offers.begin();
  }
  std::string_view best;
  double bestQ = 0;
  int bestWild = 3;
  for (std::string_view offer : offers) {
    ForEachAcceptItem(accept, [&](const AcceptItem& item) {
      if (item.q == 0) {
        return;
      }
      const int wild = Wildness(item.value, offer);
      if (wild < 0) {
        return;
      }
      if (item.q > bestQ || (item.q == bestQ && wild < bestWild)) {
        best = offer;
        bestQ = item.q;
        bestWild = wild;
      }
    });
  }
  return best;
}

bool EncodingAccepted(std::string_view acceptEncoding, std::string_view coding) {
  bool explicitMatch = false;
  bool accepted = false;
  double wildcardQ = -1;
  ForEachAcceptItem(acceptEncoding, [&](const AcceptItem& item) {
    if (CaseInsensitiveEqual(item.value, coding)) {
      explicitMatch = true;
      accepted = item.q > 0;
    } else if (item.value == "*") {
      wildcardQ = item.q;
    }
  });
  if (explicitMatch) {
    return accepted;
  }
  return wildcardQ > 0;
}

}  // namespace snowweb::http
