#pragma once

#include <string_view>

namespace snowweb::http {

// Header field names are case-insensitive (RFC 9110). They are stored here in their conventional canonical form
// for emission; parsing code compares them with CaseInsensitiveEqual.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view IfMatch = "If-Match";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view IfRange = "If-Range";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view Vary = "Vary";

// Values
inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view br = "br";
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view bytes = "bytes";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

}  // namespace snowweb::http
