#pragma once

#include "portbridge/codec.hpp"
#include "portbridge/registry.hpp"

namespace portbridge {

// math, statistics, builtins, binary
void register_core_modules(Registry& registry);

// ndarray (arrays) and frame (frames); skipped for disabled capabilities
void register_array_modules(Registry& registry, const Capabilities& caps);

inline void register_builtins(Registry& registry, const Capabilities& caps) {
    register_core_modules(registry);
    register_array_modules(registry, caps);
}

} // namespace portbridge
