#include "capdi/descriptor.hpp"

#include <any>

#ifdef CAPDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace capdi::internal {

std::any capture_stacktrace() {
#ifdef CAPDI_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace capdi::internal
