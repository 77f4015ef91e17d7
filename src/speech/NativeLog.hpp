// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace vosklink
{

/// @brief libvosk verbosity that suppresses all native diagnostics.
constexpr auto NativeLogSilent = -1;

/// @brief libvosk default verbosity.
constexpr auto NativeLogDefault = 0;

/// @brief Sets the process-wide libvosk/Kaldi log level.
///
/// Negative silences native output, zero is the library default, positive values
/// increase verbosity. May be called before any model is loaded and at any later
/// time; concurrent writers are serialized.
void setNativeLogLevel(int level);

/// @brief Returns the level most recently applied through setNativeLogLevel().
///
/// Before the first call this reports NativeLogDefault, which is libvosk's own default.
[[nodiscard]] auto nativeLogLevel() -> int;

} // namespace vosklink
