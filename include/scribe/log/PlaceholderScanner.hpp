// Repository: Retrovue-scribe
// Component: Placeholder Scanner
// Purpose: Single left-to-right tokenization of a format string.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_PLACEHOLDER_SCANNER_HPP_
#define SCRIBE_LOG_PLACEHOLDER_SCANNER_HPP_

#include <cstddef>
#include <string_view>

#include "scribe/log/ValueFormatter.hpp"

namespace scribe::log {

struct Placeholder {
  std::string_view text;       // '%' through the verb, as written
  size_t offset = 0;           // byte offset of the '%'
  size_t ordinal = 0;          // index of the argument it consumes
  size_t escaped_markers = 0;  // literal '\' bytes to emit before the value
};

// PlaceholderScanner splits a format string into literal runs and
// placeholders in one pass, without allocating.
//
// Outside a placeholder:
//   '%'   opens a placeholder; the literal run before it is reported first.
//   "\%"  is a literal '%' and opens nothing.
//   "\\"  is one literal '\', so "C:\\%s" puts a backslash before a value.
//   any other '\' is literal.
// Inside a placeholder:
//   a verb character closes it and reports the placeholder.
//   "\\"  yields one literal '\' (reported as escaped_markers); a single '\'
//         only marks an escape as pending.
//   any other character is a modifier and stays in Placeholder::text.
// A placeholder still open at the end is part of the trailing literal run.
class PlaceholderScanner {
 public:
  static constexpr char kPlaceholder = '%';
  static constexpr char kEscape = '\\';

  explicit PlaceholderScanner(std::string_view format) : format_(format) {}

  // Calls on_literal(std::string_view) and on_placeholder(const Placeholder&)
  // in source order. Empty literal runs are not reported.
  template <typename OnLiteral, typename OnPlaceholder>
  void Scan(OnLiteral&& on_literal, OnPlaceholder&& on_placeholder) const {
    bool in_placeholder = false;
    size_t placeholder_start = 0;
    bool escape_pending = false;
    size_t escaped_markers = 0;
    size_t last = 0;
    size_t ordinal = 0;

    for (size_t i = 0; i < format_.size(); ++i) {
      const char c = format_[i];

      if (in_placeholder) {
        if (IsVerb(c)) {
          Placeholder p;
          p.text = format_.substr(placeholder_start, i + 1 - placeholder_start);
          p.offset = placeholder_start;
          p.ordinal = ordinal++;
          p.escaped_markers = escaped_markers;
          on_placeholder(p);
          last = i + 1;
          in_placeholder = false;
          escape_pending = false;
        } else if (c == kEscape) {
          if (escape_pending) ++escaped_markers;
          escape_pending = !escape_pending;
        }
        continue;
      }

      if (c == kEscape && i + 1 < format_.size() &&
          (format_[i + 1] == kPlaceholder || format_[i + 1] == kEscape)) {
        if (i > last) on_literal(format_.substr(last, i - last));
        last = i + 1;  // the escaped byte starts the next literal run
        ++i;
        continue;
      }

      if (c == kPlaceholder) {
        if (i > last) on_literal(format_.substr(last, i - last));
        last = i;
        in_placeholder = true;
        placeholder_start = i;
        escape_pending = false;
        escaped_markers = 0;
      }
    }

    if (last < format_.size()) {
      on_literal(format_.substr(last));
    }
  }

  size_t CountPlaceholders() const {
    size_t count = 0;
    Scan([](std::string_view) {}, [&count](const Placeholder&) { ++count; });
    return count;
  }

 private:
  std::string_view format_;
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_PLACEHOLDER_SCANNER_HPP_
