#include "core/uri.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace modlist::core::uri {

namespace {

bool IsAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsHexDigit(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool IsUnreserved(char c) {
  return IsAlpha(c) || IsDigit(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool IsSubDelim(char c) {
  switch (c) {
  case '!':
  case '$':
  case '&':
  case '\'':
  case '(':
  case ')':
  case '*':
  case '+':
  case ',':
  case ';':
  case '=':
    return true;
  default:
    return false;
  }
}

int HexValue(char c) {
  if (IsDigit(c)) {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string DescribeChar(char c) {
  const auto as_unsigned = static_cast<unsigned char>(c);
  if (as_unsigned == ' ') {
    return "space";
  }
  if (as_unsigned < 0x20U || as_unsigned >= 0x7FU) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out = "byte 0x";
    out.push_back(kHex[as_unsigned >> 4U]);
    out.push_back(kHex[as_unsigned & 0x0FU]);
    return out;
  }
  return std::string("'") + c + "'";
}

// Checks that every character of `text` is either a percent-encoded octet or
// accepted by `allowed`. `offset` is the position of `text` inside the full
// URI so diagnostics point at the right column.
template <typename Predicate>
bool CheckComponent(std::string_view text, std::size_t offset, std::string_view component,
                    Predicate allowed, std::string& error) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '%') {
      if (i + 2 >= text.size() || !IsHexDigit(text[i + 1]) || !IsHexDigit(text[i + 2])) {
        error = "invalid percent-encoding in " + std::string(component) + " at offset " +
                std::to_string(offset + i);
        return false;
      }
      i += 2;
      continue;
    }
    if (!allowed(c)) {
      error = "invalid character " + DescribeChar(c) + " in " + std::string(component) +
              " at offset " + std::to_string(offset + i);
      return false;
    }
  }
  return true;
}

bool IsPchar(char c) {
  return IsUnreserved(c) || IsSubDelim(c) || c == ':' || c == '@';
}

bool IsPathChar(char c) {
  return IsPchar(c) || c == '/';
}

bool IsQueryOrFragmentChar(char c) {
  return IsPchar(c) || c == '/' || c == '?';
}

bool IsUserinfoChar(char c) {
  return IsUnreserved(c) || IsSubDelim(c) || c == ':';
}

bool IsRegNameChar(char c) {
  return IsUnreserved(c) || IsSubDelim(c);
}

bool IsIpv4Address(std::string_view text) {
  int octets = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t dot = text.find('.', pos);
    const std::string_view octet =
        text.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
    if (octet.empty() || octet.size() > 3U) {
      return false;
    }
    if (octet.size() > 1U && octet.front() == '0') {
      return false;
    }
    int value = 0;
    for (const char c : octet) {
      if (!IsDigit(c)) {
        return false;
      }
      value = value * 10 + (c - '0');
    }
    if (value > 255) {
      return false;
    }
    ++octets;
    if (dot == std::string_view::npos) {
      break;
    }
    pos = dot + 1;
  }
  return octets == 4;
}

bool ParseHexGroups(std::string_view text, std::vector<std::string_view>& groups) {
  groups.clear();
  if (text.empty()) {
    return true;
  }
  std::size_t pos = 0;
  while (true) {
    const std::size_t colon = text.find(':', pos);
    const std::string_view group =
        text.substr(pos, colon == std::string_view::npos ? std::string_view::npos : colon - pos);
    if (group.empty()) {
      return false;
    }
    groups.push_back(group);
    if (colon == std::string_view::npos) {
      return true;
    }
    pos = colon + 1;
  }
}

bool IsHexGroup(std::string_view group) {
  return !group.empty() && group.size() <= 4U &&
         std::all_of(group.begin(), group.end(), [](char c) { return IsHexDigit(c); });
}

// RFC 3986 IPv6address: eight 16-bit groups, at most one "::" elision, and an
// optional trailing dotted IPv4 address standing in for the last two groups.
bool IsIpv6Address(std::string_view text) {
  const std::size_t elision = text.find("::");
  if (elision != std::string_view::npos && text.find("::", elision + 1) != std::string_view::npos) {
    return false;
  }

  std::vector<std::string_view> head;
  std::vector<std::string_view> tail;
  if (elision == std::string_view::npos) {
    if (!ParseHexGroups(text, head)) {
      return false;
    }
  } else {
    if (!ParseHexGroups(text.substr(0, elision), head) ||
        !ParseHexGroups(text.substr(elision + 2), tail)) {
      return false;
    }
  }

  // A dotted quad may only end the address, so with "::" it belongs to the tail.
  std::vector<std::string_view>& last_side = elision == std::string_view::npos ? head : tail;
  std::size_t group_count = head.size() + tail.size();
  if (!last_side.empty() && last_side.back().find('.') != std::string_view::npos) {
    if (!IsIpv4Address(last_side.back())) {
      return false;
    }
    last_side.pop_back();
    group_count += 1; // dotted quad occupies two groups
  }

  for (const std::string_view group : head) {
    if (!IsHexGroup(group)) {
      return false;
    }
  }
  for (const std::string_view group : tail) {
    if (!IsHexGroup(group)) {
      return false;
    }
  }

  if (elision == std::string_view::npos) {
    return group_count == 8U;
  }
  return group_count <= 7U;
}

bool IsIpvFuture(std::string_view text) {
  if (text.size() < 4U || (text[0] != 'v' && text[0] != 'V')) {
    return false;
  }
  const std::size_t dot = text.find('.', 1);
  if (dot == std::string_view::npos || dot == 1U || dot + 1 >= text.size()) {
    return false;
  }
  for (std::size_t i = 1; i < dot; ++i) {
    if (!IsHexDigit(text[i])) {
      return false;
    }
  }
  for (std::size_t i = dot + 1; i < text.size(); ++i) {
    const char c = text[i];
    if (!IsUnreserved(c) && !IsSubDelim(c) && c != ':') {
      return false;
    }
  }
  return true;
}

bool ParseAuthority(std::string_view authority, std::size_t offset, UriParts& parts,
                    std::string& error) {
  parts.has_authority = true;

  std::string_view host_port = authority;
  const std::size_t at = authority.find('@');
  if (at != std::string_view::npos) {
    const std::string_view userinfo = authority.substr(0, at);
    if (!CheckComponent(userinfo, offset, "userinfo", IsUserinfoChar, error)) {
      return false;
    }
    parts.userinfo = std::string(userinfo);
    host_port = authority.substr(at + 1);
    offset += at + 1;
  }

  std::string_view port_text;
  bool has_port = false;
  if (!host_port.empty() && host_port.front() == '[') {
    const std::size_t close = host_port.find(']');
    if (close == std::string_view::npos) {
      error = "unterminated IP literal in host at offset " + std::to_string(offset);
      return false;
    }
    const std::string_view literal = host_port.substr(1, close - 1);
    if (!IsIpv6Address(literal) && !IsIpvFuture(literal)) {
      error = "invalid IP literal '" + std::string(literal) + "' in host";
      return false;
    }
    parts.host = std::string(host_port.substr(0, close + 1));
    const std::string_view rest = host_port.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        error = "unexpected content after IP literal at offset " +
                std::to_string(offset + close + 1);
        return false;
      }
      has_port = true;
      port_text = rest.substr(1);
    }
  } else {
    const std::size_t colon = host_port.find(':');
    const std::string_view host = host_port.substr(0, colon);
    if (!CheckComponent(host, offset, "host", IsRegNameChar, error)) {
      return false;
    }
    parts.host = std::string(host);
    if (colon != std::string_view::npos) {
      has_port = true;
      port_text = host_port.substr(colon + 1);
    }
  }

  if (has_port) {
    if (!std::all_of(port_text.begin(), port_text.end(), [](char c) { return IsDigit(c); })) {
      error = "port must contain only digits";
      return false;
    }
    parts.port = std::string(port_text);
  }
  return true;
}

} // namespace

bool ParseUri(std::string_view text, UriParts& parts, std::string& error) {
  parts = UriParts{};
  error.clear();

  if (text.empty()) {
    error = "empty string is not a URI";
    return false;
  }

  const std::size_t colon = text.find(':');
  if (colon == std::string_view::npos) {
    error = "missing scheme (expected '<scheme>:...')";
    return false;
  }
  const std::string_view scheme = text.substr(0, colon);
  if (scheme.empty() || !IsAlpha(scheme.front())) {
    error = "scheme must start with a letter";
    return false;
  }
  for (std::size_t i = 1; i < scheme.size(); ++i) {
    const char c = scheme[i];
    if (!IsAlpha(c) && !IsDigit(c) && c != '+' && c != '-' && c != '.') {
      // A ':' after an invalid scheme character usually means a relative
      // path such as "mods/a:b.jar".
      error = "invalid character " + DescribeChar(c) + " in scheme at offset " + std::to_string(i);
      return false;
    }
  }
  parts.scheme.reserve(scheme.size());
  for (const char c : scheme) {
    parts.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  std::size_t cursor = colon + 1;

  std::string_view fragment;
  bool has_fragment = false;
  std::string_view remainder = text.substr(cursor);
  const std::size_t hash = remainder.find('#');
  if (hash != std::string_view::npos) {
    has_fragment = true;
    fragment = remainder.substr(hash + 1);
    remainder = remainder.substr(0, hash);
  }

  std::string_view query;
  bool has_query = false;
  const std::size_t question = remainder.find('?');
  if (question != std::string_view::npos) {
    has_query = true;
    query = remainder.substr(question + 1);
    remainder = remainder.substr(0, question);
  }

  std::string_view path = remainder;
  if (remainder.size() >= 2U && remainder[0] == '/' && remainder[1] == '/') {
    const std::string_view after_slashes = remainder.substr(2);
    const std::size_t path_start = after_slashes.find('/');
    const std::string_view authority = after_slashes.substr(0, path_start);
    if (!ParseAuthority(authority, cursor + 2, parts, error)) {
      return false;
    }
    path = path_start == std::string_view::npos ? std::string_view{}
                                                : after_slashes.substr(path_start);
    cursor += 2 + authority.size();
  }

  if (!CheckComponent(path, cursor, "path", IsPathChar, error)) {
    return false;
  }
  parts.path = std::string(path);
  cursor += path.size();

  if (has_query) {
    if (!CheckComponent(query, cursor + 1, "query", IsQueryOrFragmentChar, error)) {
      return false;
    }
    parts.query = std::string(query);
    cursor += 1 + query.size();
  }

  if (has_fragment) {
    if (!CheckComponent(fragment, cursor + 1, "fragment", IsQueryOrFragmentChar, error)) {
      return false;
    }
    parts.fragment = std::string(fragment);
  }

  return true;
}

bool IsValidUri(std::string_view text) {
  UriParts parts;
  std::string error;
  return ParseUri(text, parts, error);
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      const int high = HexValue(text[i + 1]);
      const int low = HexValue(text[i + 2]);
      if (high >= 0 && low >= 0) {
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string LastPathSegment(const UriParts& parts) {
  std::string_view path = parts.path;
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  const std::size_t slash = path.rfind('/');
  const std::string_view segment =
      slash == std::string_view::npos ? path : path.substr(slash + 1);
  return PercentDecode(segment);
}

} // namespace modlist::core::uri
