// Repository: Retrovue-scribe
// Component: Format Arguments
// Purpose: Typed positional argument consumed by one placeholder.
// Copyright (c) 2025 RetroVue

#include "scribe/log/FormatArg.hpp"

namespace scribe::log {

const char* FormatArg::TypeName() const {
  switch (kind_) {
    case ArgKind::kBool: return "bool";
    case ArgKind::kInt: return "int64";
    case ArgKind::kUint: return "uint64";
    case ArgKind::kFloat: return "float64";
    case ArgKind::kChar: return "char";
    case ArgKind::kString: return "string";
    case ArgKind::kPointer: return "pointer";
    case ArgKind::kDuration: return "duration";
  }
  return "unknown";
}

}  // namespace scribe::log
