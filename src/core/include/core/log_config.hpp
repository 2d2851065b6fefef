#pragma once
#include <string>

// Central logging configuration / helper macros.
// Define SK_ENABLE_PLAYBACK_TRACE (CMake option SK_PLAYBACK_TRACE) to log channel assignment,
// token bumps and continuation exits. Off by default: these fire several times per frame.

namespace sk { namespace log { void debug(const std::string&) noexcept; } }

#if defined(SK_ENABLE_PLAYBACK_TRACE)
  #define SK_PLAYBACK_TRACE(msg) ::sk::log::debug(msg)
#else
  #define SK_PLAYBACK_TRACE(msg) do {} while(0)
#endif
