#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace modlist::core::uri {

// Components of an absolute URI (RFC 3986 section 3). Strings are kept as
// written (still percent-encoded) except `scheme`, which is lower-cased.
struct UriParts {
  std::string scheme;
  bool has_authority = false;
  std::optional<std::string> userinfo;
  std::string host;
  std::optional<std::string> port;
  std::string path;
  std::optional<std::string> query;
  std::optional<std::string> fragment;
};

// Parses `text` against the RFC 3986 `URI` production:
//   scheme ":" hier-part [ "?" query ] [ "#" fragment ]
//
// Contract:
// - A scheme is mandatory; relative references are rejected.
// - Returns false and sets `error` to a short reason on any syntax violation.
// - `parts` is only meaningful when the call returns true.
bool ParseUri(std::string_view text, UriParts& parts, std::string& error);

bool IsValidUri(std::string_view text);

// Decodes %XX sequences. Malformed sequences are copied through unchanged.
std::string PercentDecode(std::string_view text);

// Last non-empty path segment, percent-decoded. Empty when the path has none.
std::string LastPathSegment(const UriParts& parts);

} // namespace modlist::core::uri
