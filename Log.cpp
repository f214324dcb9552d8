// Log.cpp
#include "Log.hpp"
#include <atomic>

namespace MediaFlow {
namespace log {

namespace {
std::atomic<Level> g_level{Level::Info};
}

void setLevel(Level l) { g_level.store(l); }
Level level() { return g_level.load(); }

} // namespace log
} // namespace MediaFlow
