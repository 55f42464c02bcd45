#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "capdi/descriptor.hpp"
#include "capdi/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef CAPDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace capdi::internal {

// capture_stacktrace() is declared in descriptor.hpp (public header)
// and implemented in stacktrace_capture.cpp.

/// "IService [impl: ServiceImpl]" — used in resolution chains and logs.
inline std::string describe(const descriptor& desc) {
    std::string text = demangle(desc.capability);
    if (desc.impl_type.has_value()) {
        text += " [impl: " + demangle(desc.impl_type.value()) + "]";
    }
    return text;
}

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef CAPDI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one descriptor's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for IType [impl: Impl] (called via add_singleton):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for " + describe(desc);
    if (!desc.api_name.empty()) {
        header += " (called via " + desc.api_name + ")";
    }
    return header + ":\n" + trace;
}

} // namespace capdi::internal
