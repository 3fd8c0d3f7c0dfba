#pragma once
#include <stddef.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** Maximum length of one log line including the terminating NUL. */
#define BC_LOG_LINE_MAX 128

  /**
   * @brief Log handler callback type
   *
   * Receives one formatted diagnostic line (no trailing newline).
   * The line buffer is only valid for the duration of the call.
   *
   * @param user_data  User data pointer from BcConfig::log_user_data
   * @param line       NUL-terminated log line
   */
  typedef void (*BcLogHandler)(void *user_data, const char *line);

  // Forward declaration
  struct BcConfig;

  /**
   * @brief Format and emit one log line
   *
   * Lines longer than BC_LOG_LINE_MAX - 1 are truncated.
   * When cfg is NULL or has no handler, the line is printed to stdout as
   * "Program log: <line>".
   *
   * @param cfg  Configuration carrying the log handler (can be NULL)
   * @param fmt  printf-style format string
   */
  void bc_log(const struct BcConfig *cfg, const char *fmt, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 2, 3)))
#endif
      ;

  /**
   * @brief Default log sink: prints "Program log: <line>" to stdout.
   *
   * @param user_data  Unused
   * @param line       Log line
   */
  void bc_log_stdout(void *user_data, const char *line);

#ifdef __cplusplus
}
#endif
