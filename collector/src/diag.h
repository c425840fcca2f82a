#pragma once
#include <iostream>
#include <string>

namespace hosthealth {

    // stderr diagnostics, one line per message: "[tag] message".
    //
    // Ordering: QUIET < INFO < DEBUG. A message is printed when its level
    // is <= the current level; QUIET prints nothing but hard errors.
    enum class DiagLevel : int {
        QUIET = 0,
        INFO  = 1,
        DEBUG = 2,
    };

    inline DiagLevel& diag_level_ref() {
        static DiagLevel level = DiagLevel::INFO;
        return level;
    }

    inline void set_diag_level(DiagLevel l) { diag_level_ref() = l; }

    // Accepts quiet|info|debug. Returns false and leaves the level unchanged otherwise.
    inline bool set_diag_level_str(const std::string& s) {
        if (s == "quiet") { set_diag_level(DiagLevel::QUIET); return true; }
        if (s == "info")  { set_diag_level(DiagLevel::INFO);  return true; }
        if (s == "debug") { set_diag_level(DiagLevel::DEBUG); return true; }
        return false;
    }

    inline bool diag_enabled(DiagLevel l) {
        return l <= diag_level_ref();
    }

    inline void diag_info(const char* tag, const std::string& msg) {
        if (diag_enabled(DiagLevel::INFO)) std::cerr << "[" << tag << "] " << msg << std::endl;
    }

    inline void diag_debug(const char* tag, const std::string& msg) {
        if (diag_enabled(DiagLevel::DEBUG)) std::cerr << "[" << tag << "] " << msg << std::endl;
    }

    // Always printed, regardless of level.
    inline void diag_error(const char* tag, const std::string& msg) {
        std::cerr << "[" << tag << "] ERROR: " << msg << std::endl;
    }

} // namespace hosthealth
