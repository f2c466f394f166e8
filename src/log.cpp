#include "classforge/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>

#include <llvm/Support/raw_ostream.h>

namespace classforge::log {

namespace {
std::atomic<int> g_threshold{static_cast<int>(Level::Info)};
std::mutex g_mutex;
llvm::raw_ostream* g_stream = nullptr; // guarded by g_mutex

const char* label(Level l){
    switch(l){
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Off: break;
    }
    return "";
}
} // namespace

Level parse_level(const std::string& text, Level fallback){
    std::string s = text; std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if(s == "debug") return Level::Debug;
    if(s == "info") return Level::Info;
    if(s == "warning" || s == "warn") return Level::Warning;
    if(s == "off" || s == "none") return Level::Off;
    return fallback;
}

void setThreshold(Level level){ g_threshold.store(static_cast<int>(level)); }
Level threshold(){ return static_cast<Level>(g_threshold.load()); }

void setStream(llvm::raw_ostream* os){
    std::lock_guard<std::mutex> lk(g_mutex);
    g_stream = os;
}

bool enabled(Level level){ return level != Level::Off && static_cast<int>(level) >= g_threshold.load(); }

void write(Level level, const std::string& message){
    if(!enabled(level)) return;
    std::lock_guard<std::mutex> lk(g_mutex);
    llvm::raw_ostream& os = g_stream ? *g_stream : llvm::errs();
    os << "[classforge] " << label(level) << ": " << message << "\n";
    os.flush();
}

} // namespace classforge::log
