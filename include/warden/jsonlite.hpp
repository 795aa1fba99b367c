#pragma once

// warden/jsonlite.hpp - Minimal JSON helpers for event and audit lines.
//
// Writers build compact single-line objects with ostringstream and escape
// string fields here. Readers are only used on lines this process wrote
// (tests, event replay), so flat key lookup by regex is enough.

#include <cstdio>
#include <regex>
#include <string>

namespace warden::jsonlite {

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':  o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

inline std::string unescape(const std::string& in) {
  std::string o;
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\\' && i + 1 < in.size()) {
      const char n = in[++i];
      if (n == 'n') o += '\n';
      else if (n == 'r') o += '\r';
      else if (n == 't') o += '\t';
      else if (n == 'u' && i + 4 < in.size()) {
        // Only the control-character escapes written by escape().
        o += static_cast<char>(std::stoi(in.substr(i + 1, 4), nullptr, 16));
        i += 4;
      } else o += n;
    } else {
      o += in[i];
    }
  }
  return o;
}

inline std::string get_string(const std::string& s, const std::string& key,
                              const std::string& def = "") {
  std::regex re("\"" + key + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return def;
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return def;
}

inline long long get_i64(const std::string& s, const std::string& key, long long def = 0) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return std::stoll(m[1].str());
  return def;
}

}  // namespace warden::jsonlite
