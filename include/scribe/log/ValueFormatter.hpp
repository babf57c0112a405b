// Repository: Retrovue-scribe
// Component: Value Formatter
// Purpose: Renders one FormatArg according to a placeholder's verb and modifiers.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_VALUE_FORMATTER_HPP_
#define SCRIBE_LOG_VALUE_FORMATTER_HPP_

#include <cstdint>
#include <string>
#include <string_view>

#include "scribe/log/FormatArg.hpp"

namespace scribe::log {

// Parsed form of "%[flags][width][.precision]verb".
struct FormatSpec {
  char verb = 'v';
  bool minus = false;  // left-align
  bool plus = false;   // always print a sign
  bool sharp = false;  // alternate form
  bool space = false;  // leave a space for an elided sign
  bool zero = false;   // pad numbers with leading zeros
  int width = -1;      // -1 = none
  int precision = -1;  // -1 = none
};

// Verbs that close a placeholder.
bool IsVerb(char c);

// Whether `verb` has a rendering for arguments of `kind`.
bool VerbAccepts(char verb, ArgKind kind);

// Parses the raw placeholder text, from '%' through the verb inclusive.
// Backslashes inside the placeholder are escape markers and are skipped.
// Throws FormatError for any other character that is not a flag, digit or
// '.', or for a width/precision longer than six digits.
FormatSpec ParseFormatSpec(std::string_view placeholder);

// Appends the rendering of arg to *out.
// Throws FormatError if VerbAccepts(spec.verb, arg.kind()) is false.
void FormatValue(const FormatSpec& spec, const FormatArg& arg, std::string* out);

// "1h2m3.5s", "150ms", "1.5µs", "0s".
std::string FormatDuration(int64_t nanoseconds);

}  // namespace scribe::log

#endif  // SCRIBE_LOG_VALUE_FORMATTER_HPP_
