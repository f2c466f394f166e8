#pragma once
#include <string>

namespace llvm { class raw_ostream; }

namespace classforge::log {

enum class Level { Debug = 0, Info = 1, Warning = 2, Off = 3 };

// Parses "debug" / "info" / "warning" / "off" (case-insensitive); unknown text yields `fallback`.
Level parse_level(const std::string& text, Level fallback);

// Messages below the threshold are dropped. Default: Info.
void setThreshold(Level level);
Level threshold();

// Redirects output (default llvm::errs()). Passing null restores the default.
// The stream must outlive all logging calls.
void setStream(llvm::raw_ostream* os);

bool enabled(Level level);

// Writes "[classforge] LEVEL: message" as one line.
void write(Level level, const std::string& message);

inline void debug(const std::string& m){ write(Level::Debug, m); }
inline void info(const std::string& m){ write(Level::Info, m); }
inline void warning(const std::string& m){ write(Level::Warning, m); }

} // namespace classforge::log
