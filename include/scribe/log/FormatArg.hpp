// Repository: Retrovue-scribe
// Component: Format Arguments
// Purpose: Typed positional argument consumed by one placeholder.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_FORMAT_ARG_HPP_
#define SCRIBE_LOG_FORMAT_ARG_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace scribe::log {

enum class ArgKind : uint8_t {
  kBool,
  kInt,
  kUint,
  kFloat,
  kChar,
  kString,
  kPointer,
  kDuration,  // nanoseconds
};

// FormatArg captures one argument by value (strings by view) so a whole
// argument list can live in a stack array for the duration of one call.
// It must not outlive the call it was built for.
class FormatArg {
 public:
  FormatArg(bool v) : kind_(ArgKind::kBool) { value_.b = v; }
  FormatArg(char v) : kind_(ArgKind::kChar) { value_.i = static_cast<unsigned char>(v); }

  FormatArg(signed char v) : FormatArg(static_cast<long long>(v)) {}
  FormatArg(short v) : FormatArg(static_cast<long long>(v)) {}
  FormatArg(int v) : FormatArg(static_cast<long long>(v)) {}
  FormatArg(long v) : FormatArg(static_cast<long long>(v)) {}
  FormatArg(long long v) : kind_(ArgKind::kInt) { value_.i = static_cast<int64_t>(v); }

  FormatArg(unsigned char v) : FormatArg(static_cast<unsigned long long>(v)) {}
  FormatArg(unsigned short v) : FormatArg(static_cast<unsigned long long>(v)) {}
  FormatArg(unsigned int v) : FormatArg(static_cast<unsigned long long>(v)) {}
  FormatArg(unsigned long v) : FormatArg(static_cast<unsigned long long>(v)) {}
  FormatArg(unsigned long long v) : kind_(ArgKind::kUint) { value_.u = static_cast<uint64_t>(v); }

  FormatArg(float v) : FormatArg(static_cast<double>(v)) {}
  FormatArg(double v) : kind_(ArgKind::kFloat) { value_.f = v; }
  FormatArg(long double v) : FormatArg(static_cast<double>(v)) {}

  FormatArg(const char* v) : kind_(ArgKind::kString) {
    text_ = v != nullptr ? std::string_view(v) : std::string_view("(null)");
  }
  FormatArg(char* v) : FormatArg(static_cast<const char*>(v)) {}
  FormatArg(std::string_view v) : kind_(ArgKind::kString), text_(v) {}
  FormatArg(const std::string& v) : kind_(ArgKind::kString), text_(v) {}

  FormatArg(std::nullptr_t) : kind_(ArgKind::kPointer) { value_.p = nullptr; }
  template <typename T>
  FormatArg(const T* v) : kind_(ArgKind::kPointer) { value_.p = static_cast<const void*>(v); }

  // Durations outside the int64 nanosecond range (about 292 years either
  // way) saturate to the nearest bound. NaN counts render as zero.
  template <typename Rep, typename Period>
  FormatArg(std::chrono::duration<Rep, Period> v) : kind_(ArgKind::kDuration) {
    value_.i = SaturatingNanoseconds(v);
  }

  ArgKind kind() const { return kind_; }

  bool AsBool() const { return value_.b; }
  // Signed view of kInt, kChar and kDuration.
  int64_t AsInt() const { return value_.i; }
  uint64_t AsUint() const { return value_.u; }
  double AsFloat() const { return value_.f; }
  std::string_view AsString() const { return text_; }
  const void* AsPointer() const { return value_.p; }

  // Name reported by the %T verb.
  const char* TypeName() const;

 private:
  template <typename Rep, typename Period>
  static int64_t SaturatingNanoseconds(std::chrono::duration<Rep, Period> v) {
    // Range check in long double so the comparison itself cannot overflow.
    const std::chrono::duration<long double, std::nano> wide = v;
    const long double count = wide.count();
    if (count != count) return 0;
    if (count >= static_cast<long double>(std::numeric_limits<int64_t>::max())) {
      return std::numeric_limits<int64_t>::max();
    }
    if (count <= static_cast<long double>(std::numeric_limits<int64_t>::min())) {
      return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(v).count());
  }

  ArgKind kind_;
  union {
    bool b;
    int64_t i;
    uint64_t u;
    double f;
    const void* p;
  } value_{};
  std::string_view text_;
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_FORMAT_ARG_HPP_
