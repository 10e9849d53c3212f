#ifndef SHELLFILEOPERATOR_VERSION_H
#define SHELLFILEOPERATOR_VERSION_H

// Keep in step with project(... VERSION) in CMakeLists.txt.
#define VERSINFO_MAJOR 1
#define VERSINFO_MINORA 2
#define VERSINFO_MINORB 0

#define VERSINFO_xstr(s) VERSINFO_str(s)
#define VERSINFO_str(s) L## #s

#if defined(_M_ARM64)
#define SHELLFILEOPERATOR_VER_PLATFORM L"arm64"
#elif defined(_M_X64)
#define SHELLFILEOPERATOR_VER_PLATFORM L"x64"
#else
#define SHELLFILEOPERATOR_VER_PLATFORM L"x86"
#endif

// minorB is omitted when 0 (1.2.0 -> "1.2").
#if (VERSINFO_MINORB == 0)
#define VERSINFO_VERSION VERSINFO_xstr(VERSINFO_MAJOR) L"." VERSINFO_xstr(VERSINFO_MINORA) L" (" SHELLFILEOPERATOR_VER_PLATFORM L")"
#else
#define VERSINFO_VERSION                                                                                                                                       \
    VERSINFO_xstr(VERSINFO_MAJOR) L"." VERSINFO_xstr(VERSINFO_MINORA) L"." VERSINFO_xstr(VERSINFO_MINORB) L" (" SHELLFILEOPERATOR_VER_PLATFORM L")"
#endif

#endif // SHELLFILEOPERATOR_VERSION_H
