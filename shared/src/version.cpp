#include "portbridge/version.hpp"

namespace portbridge {

const char* resolved_version() {
#ifdef PORTBRIDGE_VERSION
    return PORTBRIDGE_VERSION;
#else
    return version().data();
#endif
}

} // namespace portbridge
