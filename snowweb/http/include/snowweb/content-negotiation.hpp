#pragma once

#include <initializer_list>
#include <string_view>

namespace snowweb::http {

// Picks the best of 'offers' (media types such as "text/plain") for the given Accept header value.
// The offer with the highest q-value wins; on ties the more specific media range wins, then the earlier offer.
// Offers excluded by q=0 are never selected.
// An empty Accept header selects the first offer. Returns an empty view if nothing is acceptable.
[[nodiscard]] std::string_view NegotiateContentType(std::string_view accept,
                                                    std::initializer_list<std::string_view> offers);

// Tells whether the Accept-Encoding header value admits 'coding' with a non zero q-value, directly or via '*'.
[[nodiscard]] bool EncodingAccepted(std::string_view acceptEncoding, std::string_view coding);

}  // namespace snowweb::http
