#pragma once

#include "portbridge/registry.hpp"

// Exports every module plugin provides. The host dlopen()s <module>.so,
// checks the ABI version, then hands init an empty module to fill.
extern "C" {
int portbridge_plugin_abi_version(void);
void portbridge_plugin_init(portbridge::Module& module);
}

#define PORTBRIDGE_DEFINE_PLUGIN_ABI                      \
    extern "C" int portbridge_plugin_abi_version(void) {  \
        return PORTBRIDGE_PLUGIN_ABI_VERSION;             \
    }
