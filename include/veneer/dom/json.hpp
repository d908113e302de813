#pragma once

#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veneer::dom {

// Attributes of an event target as the host saw them.
using AttributeSnapshot = std::map<std::string, std::string>;

struct JsonError {
  std::int32_t line{};
  std::int32_t column{};
  std::string message;
};

struct SnapshotResult {
  AttributeSnapshot attrs;
  std::vector<JsonError> errors;
  bool ok{};
};

namespace detail {

inline constexpr std::uint32_t replacement_char = 0xFFFD;

inline bool is_high_surrogate(std::uint32_t cp) {
  return cp >= 0xD800 && cp <= 0xDBFF;
}

inline bool is_low_surrogate(std::uint32_t cp) {
  return cp >= 0xDC00 && cp <= 0xDFFF;
}

inline void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    cp = replacement_char;
  }
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Reads the one shape the host sends: a flat object whose values are
// strings, or null/bool/number scalars. Positions are 1-based.
class SnapshotReader {
public:
  SnapshotReader(std::string_view src, std::vector<JsonError> &errors)
      : src_{src}, errors_{&errors} {}

  std::optional<AttributeSnapshot> read() {
    skip_ws();
    if (!expect('{')) {
      return std::nullopt;
    }
    AttributeSnapshot attrs;
    skip_ws();
    if (!accept('}')) {
      for (;;) {
        skip_ws();
        auto key = read_string();
        if (!key) {
          return std::nullopt;
        }
        skip_ws();
        if (!expect(':')) {
          return std::nullopt;
        }
        skip_ws();
        auto value = read_scalar(*key);
        if (!value) {
          return std::nullopt;
        }
        attrs.insert_or_assign(std::move(*key), std::move(*value));
        skip_ws();
        if (accept('}')) {
          break;
        }
        if (!expect(',')) {
          return std::nullopt;
        }
      }
    }
    skip_ws();
    if (pos_ < src_.size()) {
      error("unexpected trailing characters");
      return std::nullopt;
    }
    return attrs;
  }

private:
  void error(std::string msg) {
    errors_->push_back(JsonError{line_, col_, std::move(msg)});
  }

  char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

  char next() {
    if (pos_ >= src_.size()) {
      return '\0';
    }
    const char c = src_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  void skip_ws() {
    while (peek() == ' ' || peek() == '\t' || peek() == '\r' ||
           peek() == '\n') {
      next();
    }
  }

  bool accept(char c) {
    if (peek() != c) {
      return false;
    }
    next();
    return true;
  }

  bool expect(char c) {
    if (accept(c)) {
      return true;
    }
    error(std::string{"expected '"} + c + "'");
    return false;
  }

  bool accept_word(std::string_view w) {
    if (src_.substr(pos_, w.size()) != w) {
      return false;
    }
    for (std::size_t k = 0; k < w.size(); ++k) {
      next();
    }
    return true;
  }

  std::optional<std::string> read_scalar(const std::string &key) {
    const char c = peek();
    if (c == '"') {
      return read_string();
    }
    if (c == '{' || c == '[') {
      error("attribute '" + key + "' is not a scalar");
      return std::nullopt;
    }
    if (accept_word("null")) {
      return std::string{};
    }
    if (accept_word("true")) {
      return std::string{"true"};
    }
    if (accept_word("false")) {
      return std::string{"false"};
    }
    if (c == '-' || (c >= '0' && c <= '9')) {
      return read_number();
    }
    error("unexpected token");
    return std::nullopt;
  }

  // Numbers keep their literal spelling.
  std::optional<std::string> read_number() {
    const std::size_t start = pos_;
    accept('-');
    std::size_t digits = 0;
    const auto run = [&] {
      while (peek() >= '0' && peek() <= '9') {
        next();
        ++digits;
      }
    };
    run();
    if (accept('.')) {
      run();
    }
    if (peek() == 'e' || peek() == 'E') {
      next();
      if (!accept('+')) {
        accept('-');
      }
      run();
    }
    if (digits == 0) {
      error("expected number");
      return std::nullopt;
    }
    return std::string{src_.substr(start, pos_ - start)};
  }

  std::optional<std::uint32_t> read_hex4() {
    std::uint32_t v = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = next();
      v <<= 4;
      if (c >= '0' && c <= '9') {
        v |= static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        v |= static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        v |= static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        error("invalid \\u escape");
        return std::nullopt;
      }
    }
    return v;
  }

  // After "\u". Unpaired surrogates decode to U+FFFD; a high surrogate
  // followed by a non-surrogate escape leaves that escape to the next turn.
  bool read_unicode_escape(std::string &out) {
    auto cp = read_hex4();
    if (!cp) {
      return false;
    }
    if (is_high_surrogate(*cp) && src_.substr(pos_, 2) == "\\u") {
      const auto save_pos = pos_;
      const auto save_col = col_;
      next();
      next();
      auto lo = read_hex4();
      if (!lo) {
        return false;
      }
      if (is_low_surrogate(*lo)) {
        append_utf8(out, 0x10000 + ((*cp - 0xD800) << 10) + (*lo - 0xDC00));
        return true;
      }
      pos_ = save_pos;
      col_ = save_col;
    }
    append_utf8(out, *cp);
    return true;
  }

  std::optional<std::string> read_string() {
    if (peek() != '"') {
      error("expected string");
      return std::nullopt;
    }
    next();
    std::string out;
    while (pos_ < src_.size()) {
      const char c = next();
      if (c == '"') {
        return out;
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = next();
      switch (e) {
      case '"':
      case '\\':
      case '/':
        out.push_back(e);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!read_unicode_escape(out)) {
          return std::nullopt;
        }
        break;
      default:
        error("unsupported escape");
        return std::nullopt;
      }
    }
    error("unterminated string");
    return std::nullopt;
  }

  std::string_view src_;
  std::vector<JsonError> *errors_{};
  std::size_t pos_{};
  std::int32_t line_{1};
  std::int32_t col_{1};
};

inline void write_json_string(std::string &out, std::string_view s) {
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buf;
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  out.push_back('"');
}

} // namespace detail

// Decodes the {"name": "value", ...} object the host sends with a delegated
// event. Null values (attributes without a value) decode to empty strings.
inline SnapshotResult parse_attribute_snapshot(std::string_view json) {
  SnapshotResult out;
  detail::SnapshotReader reader{json, out.errors};
  if (auto attrs = reader.read()) {
    out.attrs = std::move(*attrs);
    out.ok = true;
  }
  return out;
}

inline std::string write_attribute_snapshot(const AttributeSnapshot &attrs) {
  std::string out;
  out.push_back('{');
  bool first = true;
  for (const auto &kv : attrs) {
    if (!std::exchange(first, false)) {
      out.push_back(',');
    }
    detail::write_json_string(out, kv.first);
    out.push_back(':');
    detail::write_json_string(out, kv.second);
  }
  out.push_back('}');
  return out;
}

} // namespace veneer::dom
