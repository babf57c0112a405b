// Repository: Retrovue-scribe
// Component: Value Formatter
// Purpose: Renders one FormatArg according to a placeholder's verb and modifiers.
// Copyright (c) 2025 RetroVue

#include "scribe/log/ValueFormatter.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "scribe/log/WriterErrors.hpp"

namespace scribe::log {

namespace {

constexpr int kMaxModifierDigits = 6;
constexpr const char* kVerbs = "dfvbopxXctsTqUeEgG";
constexpr const char* kLowerDigits = "0123456789abcdef";
constexpr const char* kUpperDigits = "0123456789ABCDEF";

// Decimal exponent at which shortest-form floats switch to scientific notation.
constexpr int kShortestExpThreshold = 6;

size_t RuneCount(std::string_view s) {
  size_t n = 0;
  for (char c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
  }
  return n;
}

// Byte length of the first `runes` UTF-8 sequences of s.
size_t RunePrefixBytes(std::string_view s, size_t runes) {
  size_t seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      if (seen == runes) return i;
      ++seen;
    }
  }
  return s.size();
}

// Pads to spec.width, counted in runes. The zero flag left-pads with '0'.
void AppendPadded(const FormatSpec& spec, std::string_view body, std::string* out) {
  size_t len = RuneCount(body);
  if (spec.width < 0 || len >= static_cast<size_t>(spec.width)) {
    out->append(body);
    return;
  }
  size_t pad = static_cast<size_t>(spec.width) - len;
  if (spec.minus) {
    out->append(body);
    out->append(pad, ' ');
  } else {
    out->append(pad, spec.zero ? '0' : ' ');
    out->append(body);
  }
}

// Number padding: zeros go between the sign/prefix and the digits.
void AppendNumber(const FormatSpec& spec, std::string_view sign, std::string_view digits,
                  bool zero_allowed, std::string* out) {
  size_t len = sign.size() + digits.size();
  if (spec.width < 0 || len >= static_cast<size_t>(spec.width)) {
    out->append(sign);
    out->append(digits);
    return;
  }
  size_t pad = static_cast<size_t>(spec.width) - len;
  if (spec.minus) {
    out->append(sign);
    out->append(digits);
    out->append(pad, ' ');
  } else if (spec.zero && zero_allowed) {
    out->append(sign);
    out->append(pad, '0');
    out->append(digits);
  } else {
    out->append(pad, ' ');
    out->append(sign);
    out->append(digits);
  }
}

std::string_view SignFor(const FormatSpec& spec, bool negative) {
  if (negative) return "-";
  if (spec.plus) return "+";
  if (spec.space) return " ";
  return "";
}

void FormatInteger(const FormatSpec& spec, bool negative, uint64_t magnitude, int base,
                   bool upper, std::string* out) {
  const char* table = upper ? kUpperDigits : kLowerDigits;
  char buf[72];
  size_t pos = sizeof(buf);
  // An explicit zero precision prints nothing for a zero value.
  if (!(magnitude == 0 && spec.precision == 0)) {
    do {
      buf[--pos] = table[magnitude % static_cast<uint64_t>(base)];
      magnitude /= static_cast<uint64_t>(base);
    } while (magnitude != 0);
  }
  std::string digits(buf + pos, sizeof(buf) - pos);
  if (spec.precision > 0 && digits.size() < static_cast<size_t>(spec.precision)) {
    digits.insert(0, static_cast<size_t>(spec.precision) - digits.size(), '0');
  }

  std::string sign(SignFor(spec, negative));
  if (spec.sharp) {
    switch (base) {
      case 2: sign += "0b"; break;
      case 8:
        if (digits.empty() || digits[0] != '0') digits.insert(0, 1, '0');
        break;
      case 16: sign += upper ? "0X" : "0x"; break;
      default: break;
    }
  }
  AppendNumber(spec, sign, digits, spec.precision < 0, out);
}

void FormatSigned(const FormatSpec& spec, int64_t v, int base, bool upper, std::string* out) {
  bool negative = v < 0;
  uint64_t magnitude = negative ? static_cast<uint64_t>(-(v + 1)) + 1 : static_cast<uint64_t>(v);
  FormatInteger(spec, negative, magnitude, base, upper, out);
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    cp = 0xFFFD;
  }
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Escapes one ASCII byte for a quoted literal; bytes >= 0x80 are copied.
void AppendEscaped(unsigned char c, char quote, std::string* out) {
  switch (c) {
    case '\a': out->append("\\a"); return;
    case '\b': out->append("\\b"); return;
    case '\f': out->append("\\f"); return;
    case '\n': out->append("\\n"); return;
    case '\r': out->append("\\r"); return;
    case '\t': out->append("\\t"); return;
    case '\v': out->append("\\v"); return;
    case '\\': out->append("\\\\"); return;
    default: break;
  }
  if (c == static_cast<unsigned char>(quote)) {
    out->push_back('\\');
    out->push_back(quote);
    return;
  }
  if (c < 0x20 || c == 0x7F) {
    char buf[8];
    snprintf(buf, sizeof(buf), "\\x%02x", c);
    out->append(buf);
    return;
  }
  out->push_back(static_cast<char>(c));
}

std::string QuoteString(std::string_view s) {
  std::string q;
  q.reserve(s.size() + 2);
  q.push_back('"');
  for (char c : s) AppendEscaped(static_cast<unsigned char>(c), '"', &q);
  q.push_back('"');
  return q;
}

bool CanBackquote(std::string_view s) {
  for (char c : s) {
    unsigned char u = static_cast<unsigned char>(c);
    if (c == '`' || u == 0x7F || (u < 0x20 && c != '\t')) return false;
  }
  return true;
}

std::string QuoteRune(uint32_t cp) {
  std::string q("'");
  if (cp < 0x80) {
    AppendEscaped(static_cast<unsigned char>(cp), '\'', &q);
  } else {
    AppendUtf8(cp, &q);
  }
  q.push_back('\'');
  return q;
}

std::string UnicodeNotation(uint64_t cp, bool with_char) {
  char buf[32];
  snprintf(buf, sizeof(buf), "U+%04llX", static_cast<unsigned long long>(cp));
  std::string u(buf);
  if (with_char && cp >= 0x20 && cp != 0x7F && cp <= 0x10FFFF &&
      !(cp >= 0xD800 && cp <= 0xDFFF)) {
    u += " '";
    AppendUtf8(static_cast<uint32_t>(cp), &u);
    u += "'";
  }
  return u;
}

// Shortest digits that round-trip, laid out as %e when the decimal exponent
// is outside [-4, exp_threshold), otherwise as %f.
std::string ShortestFloat(double v, int exp_threshold, bool upper) {
  char buf[96];
  int p = 0;
  for (; p < 17; ++p) {
    snprintf(buf, sizeof(buf), "%.*e", p, v);
    if (std::strtod(buf, nullptr) == v) break;
  }
  if (p == 17) {
    p = 16;
    snprintf(buf, sizeof(buf), "%.*e", p, v);
  }
  const char* e = std::strchr(buf, 'e');
  int exp = e != nullptr ? std::atoi(e + 1) : 0;
  if (exp < -4 || exp >= exp_threshold) {
    std::string sci(buf);
    if (upper) {
      for (char& c : sci) {
        if (c == 'e') c = 'E';
      }
    }
    return sci;
  }
  int decimals = p - exp;
  if (decimals < 0) decimals = 0;
  snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return std::string(buf);
}

// '#' on shortest %g: keep a decimal point and pad with trailing zeros to
// six significant digits. The exponent, if any, stays at the end.
void PadSignificantDigits(std::string* num) {
  std::string tail;
  const size_t e = num->find_first_of("eE");
  if (e != std::string::npos) {
    tail = num->substr(e);
    num->resize(e);
  }
  int digits = 6;
  bool has_point = false;
  bool seen_nonzero = false;
  for (char c : *num) {
    if (c == '.') {
      has_point = true;
    } else if (c >= '0' && c <= '9') {
      if (c != '0') seen_nonzero = true;
      if (seen_nonzero) --digits;
    }
  }
  if (!has_point) {
    if (*num == "0" || *num == "-0") --digits;
    num->push_back('.');
  }
  for (; digits > 0; --digits) num->push_back('0');
  num->append(tail);
}

// Hexadecimal float exponents carry at least two digits ("p+00").
void WidenHexExponent(std::string* num) {
  const size_t p = num->find_first_of("pP");
  if (p == std::string::npos || p + 2 >= num->size()) return;
  if (num->size() - (p + 2) == 1) num->insert(p + 2, 1, '0');
}

void FormatFloat(const FormatSpec& spec, double v, std::string* out) {
  char verb = spec.verb;

  if (std::isnan(v) || std::isinf(v)) {
    std::string body = std::isnan(v) ? "NaN" : (v < 0 ? "-Inf" : "+Inf");
    FormatSpec spaced = spec;
    spaced.zero = false;
    AppendPadded(spaced, body, out);
    return;
  }

  const bool general = verb == 'g' || verb == 'G';
  if (verb == 'v' || verb == 's') {
    verb = 'g';
  }
  if ((verb == 'g' || verb == 'G') && spec.precision < 0) {
    std::string body = ShortestFloat(v, kShortestExpThreshold, verb == 'G');
    if (general && spec.sharp) PadSignificantDigits(&body);
    bool negative = !body.empty() && body[0] == '-';
    std::string_view digits(body);
    if (negative) digits.remove_prefix(1);
    AppendNumber(spec, SignFor(spec, negative), digits, true, out);
    return;
  }

  // Width and padding are applied below so the hex exponent can be widened first.
  std::string fmt("%");
  if (spec.plus) {
    fmt += '+';
  } else if (spec.space) {
    fmt += ' ';
  }
  if (spec.sharp) fmt += '#';
  if (spec.precision >= 0) fmt += "." + std::to_string(spec.precision);
  if (verb == 'x') {
    fmt += 'a';
  } else if (verb == 'X') {
    fmt += 'A';
  } else {
    fmt += verb;
  }

  char buf[128];
  int n = snprintf(buf, sizeof(buf), fmt.c_str(), v);
  if (n < 0) {
    throw FormatError("cannot render floating point value with \"" + fmt + "\"");
  }
  std::string body;
  if (static_cast<size_t>(n) < sizeof(buf)) {
    body.assign(buf, static_cast<size_t>(n));
  } else {
    body.assign(static_cast<size_t>(n) + 1, '\0');
    snprintf(&body[0], body.size(), fmt.c_str(), v);
    body.resize(static_cast<size_t>(n));
  }
  if (verb == 'x' || verb == 'X') WidenHexExponent(&body);

  std::string_view digits(body);
  std::string_view sign;
  if (!digits.empty() && (digits[0] == '-' || digits[0] == '+' || digits[0] == ' ')) {
    sign = digits.substr(0, 1);
    digits.remove_prefix(1);
  }
  AppendNumber(spec, sign, digits, true, out);
}

void FormatHexBytes(const FormatSpec& spec, std::string_view bytes, std::string* out) {
  if (spec.precision >= 0 && bytes.size() > static_cast<size_t>(spec.precision)) {
    bytes = bytes.substr(0, static_cast<size_t>(spec.precision));
  }
  const bool upper = spec.verb == 'X';
  const char* table = upper ? kUpperDigits : kLowerDigits;
  const char* prefix = upper ? "0X" : "0x";
  std::string body;
  body.reserve(bytes.size() * 3);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (spec.space && i > 0) body.push_back(' ');
    if (spec.sharp && (spec.space || i == 0)) body += prefix;
    unsigned char b = static_cast<unsigned char>(bytes[i]);
    body.push_back(table[b >> 4]);
    body.push_back(table[b & 0x0F]);
  }
  AppendPadded(spec, body, out);
}

void FormatString(const FormatSpec& spec, std::string_view s, std::string* out) {
  if (spec.verb == 'x' || spec.verb == 'X') {
    FormatHexBytes(spec, s, out);
    return;
  }
  if (spec.precision >= 0) {
    s = s.substr(0, RunePrefixBytes(s, static_cast<size_t>(spec.precision)));
  }
  if (spec.verb == 'q' || (spec.verb == 'v' && spec.sharp)) {
    if (spec.verb == 'q' && spec.sharp && CanBackquote(s)) {
      std::string raw("`");
      raw.append(s);
      raw.push_back('`');
      AppendPadded(spec, raw, out);
      return;
    }
    AppendPadded(spec, QuoteString(s), out);
    return;
  }
  AppendPadded(spec, s, out);
}

// Integer-valued kinds: kInt, kUint, kChar, kDuration.
void FormatIntegral(const FormatSpec& spec, const FormatArg& arg, std::string* out) {
  const bool is_unsigned = arg.kind() == ArgKind::kUint;
  const uint64_t as_unsigned = is_unsigned ? arg.AsUint() : static_cast<uint64_t>(arg.AsInt());

  switch (spec.verb) {
    case 'c':
      if (!is_unsigned && arg.AsInt() < 0) {
        std::string c;
        AppendUtf8(0xFFFD, &c);
        AppendPadded(spec, c, out);
      } else {
        std::string c;
        AppendUtf8(static_cast<uint32_t>(as_unsigned > 0x10FFFF ? 0xFFFD : as_unsigned), &c);
        AppendPadded(spec, c, out);
      }
      return;
    case 'q':
      AppendPadded(spec, QuoteRune(static_cast<uint32_t>(
                             (!is_unsigned && arg.AsInt() < 0) || as_unsigned > 0x10FFFF
                                 ? 0xFFFD : as_unsigned)), out);
      return;
    case 'U':
      AppendPadded(spec, UnicodeNotation(as_unsigned, spec.sharp), out);
      return;
    case 'e': case 'E': case 'f': case 'g': case 'G':
      FormatFloat(spec, is_unsigned ? static_cast<double>(arg.AsUint())
                                    : static_cast<double>(arg.AsInt()), out);
      return;
    default:
      break;
  }

  if (arg.kind() == ArgKind::kDuration && (spec.verb == 'v' || spec.verb == 's')) {
    AppendPadded(spec, FormatDuration(arg.AsInt()), out);
    return;
  }
  if (arg.kind() == ArgKind::kChar && (spec.verb == 'v' || spec.verb == 's')) {
    std::string c;
    AppendUtf8(static_cast<uint32_t>(arg.AsInt()), &c);
    AppendPadded(spec, c, out);
    return;
  }

  int base = 10;
  bool upper = false;
  switch (spec.verb) {
    case 'b': base = 2; break;
    case 'o': base = 8; break;
    case 'x': base = 16; break;
    case 'X': base = 16; upper = true; break;
    default: break;
  }
  if (is_unsigned) {
    FormatInteger(spec, false, arg.AsUint(), base, upper, out);
  } else {
    FormatSigned(spec, arg.AsInt(), base, upper, out);
  }
}

void FormatPointer(const FormatSpec& spec, const void* p, std::string* out) {
  const uint64_t value = static_cast<uint64_t>(reinterpret_cast<uintptr_t>(p));
  FormatSpec hex = spec;
  hex.verb = spec.verb == 'X' ? 'X' : 'x';
  hex.plus = false;
  hex.space = false;
  if (spec.verb == 'p' || spec.verb == 'v' || spec.verb == 's') {
    // %p carries the prefix unless '#' asks for bare digits.
    hex.sharp = !spec.sharp;
  }
  FormatInteger(hex, false, value, 16, hex.verb == 'X', out);
}

}  // namespace

bool IsVerb(char c) {
  return c != '\0' && std::strchr(kVerbs, c) != nullptr;
}

bool VerbAccepts(char verb, ArgKind kind) {
  switch (verb) {
    case 'v':
    case 's':
    case 'T':
      return true;
    case 't':
      return kind == ArgKind::kBool;
    case 'd':
    case 'b':
    case 'o':
      return kind == ArgKind::kInt || kind == ArgKind::kUint || kind == ArgKind::kChar ||
             kind == ArgKind::kDuration;
    case 'x':
    case 'X':
      return kind != ArgKind::kBool;
    case 'c':
    case 'U':
      return kind == ArgKind::kInt || kind == ArgKind::kUint || kind == ArgKind::kChar;
    case 'q':
      return kind == ArgKind::kInt || kind == ArgKind::kUint || kind == ArgKind::kChar ||
             kind == ArgKind::kString;
    case 'e':
    case 'E':
    case 'f':
    case 'g':
    case 'G':
      return kind == ArgKind::kFloat || kind == ArgKind::kInt || kind == ArgKind::kUint;
    case 'p':
      return kind == ArgKind::kPointer;
    default:
      return false;
  }
}

FormatSpec ParseFormatSpec(std::string_view placeholder) {
  if (placeholder.size() < 2 || placeholder.front() != '%' || !IsVerb(placeholder.back())) {
    throw FormatError("malformed placeholder \"" + std::string(placeholder) + "\"");
  }

  enum class Phase { kFlags, kWidth, kPrecision };
  FormatSpec spec;
  spec.verb = placeholder.back();
  Phase phase = Phase::kFlags;
  int digits = 0;

  for (size_t i = 1; i + 1 < placeholder.size(); ++i) {
    char c = placeholder[i];
    if (c == '\\') continue;

    if (phase == Phase::kFlags) {
      switch (c) {
        case '-': spec.minus = true; continue;
        case '+': spec.plus = true; continue;
        case '#': spec.sharp = true; continue;
        case ' ': spec.space = true; continue;
        case '0': spec.zero = true; continue;
        default: break;
      }
    }

    if (c >= '0' && c <= '9') {
      if (phase == Phase::kFlags) {
        phase = Phase::kWidth;
        spec.width = 0;
        digits = 0;
      }
      if (++digits > kMaxModifierDigits) {
        throw FormatError("width or precision too large in \"" + std::string(placeholder) + "\"");
      }
      int& target = phase == Phase::kWidth ? spec.width : spec.precision;
      target = target * 10 + (c - '0');
      continue;
    }

    if (c == '.' && phase != Phase::kPrecision) {
      phase = Phase::kPrecision;
      spec.precision = 0;
      digits = 0;
      continue;
    }

    throw FormatError("unsupported modifier '" + std::string(1, c) + "' in \"" +
                      std::string(placeholder) + "\"");
  }

  if (spec.minus) spec.zero = false;
  return spec;
}

void FormatValue(const FormatSpec& spec, const FormatArg& arg, std::string* out) {
  if (!VerbAccepts(spec.verb, arg.kind())) {
    throw FormatError(std::string("verb %") + spec.verb + " is not applicable to " +
                      arg.TypeName() + " argument");
  }

  if (spec.verb == 'T') {
    AppendPadded(spec, arg.TypeName(), out);
    return;
  }

  switch (arg.kind()) {
    case ArgKind::kBool:
      AppendPadded(spec, arg.AsBool() ? "true" : "false", out);
      return;
    case ArgKind::kFloat:
      FormatFloat(spec, arg.AsFloat(), out);
      return;
    case ArgKind::kString:
      FormatString(spec, arg.AsString(), out);
      return;
    case ArgKind::kPointer:
      FormatPointer(spec, arg.AsPointer(), out);
      return;
    case ArgKind::kInt:
    case ArgKind::kUint:
    case ArgKind::kChar:
    case ArgKind::kDuration:
      FormatIntegral(spec, arg, out);
      return;
  }
}

std::string FormatDuration(int64_t nanoseconds) {
  if (nanoseconds == 0) return "0s";

  const bool negative = nanoseconds < 0;
  uint64_t u = negative ? static_cast<uint64_t>(-(nanoseconds + 1)) + 1
                        : static_cast<uint64_t>(nanoseconds);
  std::string out;

  // Integer part plus up to `precision` fractional digits, trailing zeros trimmed.
  auto fraction = [](uint64_t v, int precision) {
    uint64_t scale = 1;
    for (int i = 0; i < precision; ++i) scale *= 10;
    std::string s = std::to_string(v / scale);
    uint64_t frac = v % scale;
    if (frac != 0) {
      std::string digits = std::to_string(frac);
      digits.insert(0, static_cast<size_t>(precision) - digits.size(), '0');
      while (!digits.empty() && digits.back() == '0') digits.pop_back();
      s += "." + digits;
    }
    return s;
  };

  if (u < 1000ULL) {
    out = std::to_string(u) + "ns";
  } else if (u < 1000000ULL) {
    out = fraction(u, 3) + "\xc2\xb5s";
  } else if (u < 1000000000ULL) {
    out = fraction(u, 6) + "ms";
  } else {
    const uint64_t secs = u / 1000000000ULL;
    out = fraction(u % 60000000000ULL, 9) + "s";
    const uint64_t mins = secs / 60;
    if (mins > 0) {
      out = std::to_string(mins % 60) + "m" + out;
      const uint64_t hours = mins / 60;
      if (hours > 0) {
        out = std::to_string(hours) + "h" + out;
      }
    }
  }
  return negative ? "-" + out : out;
}

}  // namespace scribe::log
