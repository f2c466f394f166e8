#pragma once
#include "classforge/log.hpp"

namespace classforge {

// Highest class-file major version the version rule may write (Java 21).
constexpr int kDefaultMaxClassVersion = 65;

struct Options {
    // Log classes no rule touched (diagnostic only).
    bool printUntransformedClass = false;
    int maxSupportedClassVersion = kDefaultMaxClassVersion;
    // Process-wide; applied by the default ClassTransformer constructor.
    log::Level logLevel = log::Level::Info;
};

// Reads options from the process environment:
//   CLASSFORGE_PRINT_UNTRANSFORMED=1   log classes left untouched
//   CLASSFORGE_MAX_CLASS_VERSION=<n>   supported class-file major version ceiling
//   CLASSFORGE_LOG_LEVEL=debug|info|warning|off
// Unset, empty or unparsable values keep the defaults.
Options detectOptions();

} // namespace classforge
