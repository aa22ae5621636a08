/**
 * version.hpp - Mnemo version information
 */

#pragma once

// ============================================================================
// Version Information
// ============================================================================
#define MNEMO_VERSION "1.0.0"
#define MNEMO_MAJOR_VERSION 1
#define MNEMO_PROGRAM_NAME "mnemo"

// Bundled word lists, set by the build
#ifndef MNEMO_DEFAULT_WORDLIST_DIR
#define MNEMO_DEFAULT_WORDLIST_DIR "./data/wordlists"
#endif

namespace mnemo {
namespace version {

constexpr const char* name() {
    return MNEMO_PROGRAM_NAME;
}

constexpr const char* string() {
    return MNEMO_VERSION;
}

constexpr int major() {
    return MNEMO_MAJOR_VERSION;
}

constexpr const char* default_wordlist_dir() {
    return MNEMO_DEFAULT_WORDLIST_DIR;
}

}  // namespace version
}  // namespace mnemo
