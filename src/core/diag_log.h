// Tagged stderr diagnostics shared by the analysis components.

#ifndef AFFECT_CORE_DIAG_LOG_H
#define AFFECT_CORE_DIAG_LOG_H

namespace affect {

/// @brief Write a warning line "[tag] message" to stderr.
///
/// Warnings report data problems (unparseable gates, failed evaluations)
/// and are emitted regardless of verbosity.
///
/// @param tag Component tag, e.g. "GateChecker".
/// @param fmt printf-style format string.
void logWarn(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/// @brief Write a debug line to stderr when verbose is true.
/// @param verbose Caller's verbosity flag.
/// @param tag Component tag.
/// @param fmt printf-style format string.
void logDebug(bool verbose, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace affect

#endif  // AFFECT_CORE_DIAG_LOG_H
