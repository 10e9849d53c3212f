#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "SelfTestCommon.h"

namespace FileOperatorSelfTest
{
// Runs against the real shell copy engine inside the suite artifact directory. Must be called from a
// thread that has not entered the MTA.
[[nodiscard]] SelfTest::SuiteReport Run(const SelfTest::RunOptions& options = {}) noexcept;
}
