#pragma once

#include <veneer/dom/error.hpp>
#include <veneer/dom/log.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace veneer::dom {

using Handle = std::uint32_t;

namespace detail {

// Frequently used tag and attribute names. Must stay sorted and unique: the
// position of a string is its handle and lookup is a binary search. The empty
// string is handle 0 and doubles as the value of value-less attributes.
inline constexpr std::array<std::string_view, 129> static_strings{
    "",           "a",           "abbr",       "accept",       "action",
    "alt",        "area",        "aria-hidden", "aria-label",  "article",
    "aside",      "audio",       "autocomplete", "autofocus",  "b",
    "blockquote", "body",        "br",         "button",       "canvas",
    "caption",    "checked",     "cite",       "class",        "code",
    "col",        "colspan",     "content",    "contenteditable", "data",
    "datetime",   "dd",          "details",    "dialog",       "dir",
    "disabled",   "div",         "dl",         "download",     "draggable",
    "dt",         "em",          "embed",      "enctype",      "fieldset",
    "figcaption", "figure",      "footer",     "for",          "form",
    "h1",         "h2",          "h3",         "h4",           "h5",
    "h6",         "head",        "header",     "height",       "hidden",
    "hr",         "href",        "html",       "i",            "id",
    "iframe",     "img",         "input",      "label",        "lang",
    "li",         "link",        "main",       "max",          "maxlength",
    "meta",       "method",      "min",        "multiple",     "name",
    "nav",        "ol",          "option",     "p",            "placeholder",
    "pre",        "readonly",    "rel",        "required",     "role",
    "rows",       "rowspan",     "script",     "section",      "select",
    "selected",   "small",       "source",     "span",         "src",
    "strong",     "style",       "sub",        "summary",      "sup",
    "tabindex",   "table",       "target",     "tbody",        "td",
    "textarea",   "tfoot",       "th",         "thead",        "time",
    "title",      "tr",          "track",      "type",         "u",
    "ul",         "value",       "video",      "wbr",          "width",
    "wrap",       "xlink:href",  "xmlns",      "xmlns:xlink",
};

} // namespace detail

struct ResolveResult {
  std::string_view value;
  Error error;
  bool ok{};
};

// Bidirectional string <-> handle map. The static table is shared by every
// instance; the dynamic table is append-only, so issued handles and the views
// returned for them stay valid for the lifetime of the interner.
class Interner {
public:
  static constexpr std::size_t static_size() noexcept {
    return detail::static_strings.size();
  }

  Interner() = default;
  Interner(const Interner &) = delete;
  Interner &operator=(const Interner &) = delete;

  Handle intern(std::string_view s) {
    if (auto h = find(s)) {
      return *h;
    }
    const auto h = static_cast<Handle>(static_size() + dynamic_.size());
    const auto &stored = dynamic_.emplace_back(s);
    index_.emplace(std::string_view{stored}, h);
    VENEER_LOG_DEBUG("intern #%u '%s'", static_cast<unsigned>(h),
                     stored.c_str());
    return h;
  }

  std::optional<Handle> find(std::string_view s) const {
    const auto &tbl = detail::static_strings;
    const auto it = std::lower_bound(tbl.begin(), tbl.end(), s);
    if (it != tbl.end() && *it == s) {
      return static_cast<Handle>(std::distance(tbl.begin(), it));
    }
    if (const auto dit = index_.find(s); dit != index_.end()) {
      return dit->second;
    }
    return std::nullopt;
  }

  ResolveResult resolve(Handle h) const {
    if (h < static_size()) {
      return ResolveResult{detail::static_strings[h], {}, true};
    }
    const std::size_t i = h - static_size();
    if (i < dynamic_.size()) {
      return ResolveResult{dynamic_[i], {}, true};
    }
    return ResolveResult{
        {},
        make_error(ErrorCode::InvalidHandle,
                   "handle " + std::to_string(h) + " was never issued"),
        false};
  }

  // Unchecked form for handles that came out of this interner.
  std::string_view str(Handle h) const {
    auto r = resolve(h);
    if (!r.ok) {
      VENEER_LOG_ERROR("%s", r.error.message.c_str());
    }
    return r.value;
  }

  bool is_static(Handle h) const noexcept { return h < static_size(); }

  bool contains(Handle h) const noexcept {
    return h < static_size() + dynamic_.size();
  }

  std::size_t dynamic_size() const noexcept { return dynamic_.size(); }

  std::size_t size() const noexcept { return static_size() + dynamic_.size(); }

private:
  std::deque<std::string> dynamic_;
  std::unordered_map<std::string_view, Handle> index_;
};

} // namespace veneer::dom
