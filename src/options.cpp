#include "classforge/options.hpp"
#include <cstdlib>
#include <string>

namespace classforge {

Options detectOptions(){
    Options o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("CLASSFORGE_PRINT_UNTRANSFORMED")) o.printUntransformedClass = (std::string(v) == "1");

    if (const char* v = get("CLASSFORGE_MAX_CLASS_VERSION")) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (end && *end == '\0' && n > 0 && n <= 0xFFFF) o.maxSupportedClassVersion = static_cast<int>(n);
    }

    if (const char* v = get("CLASSFORGE_LOG_LEVEL")) o.logLevel = log::parse_level(v, o.logLevel);

    return o;
}

} // namespace classforge
