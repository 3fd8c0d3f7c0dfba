#include "bytecalc/log.h"

#include <stdarg.h>
#include <stdio.h>

#include "bytecalc/calc_api.h"

extern "C"
{
  void bc_log_stdout(void *user_data, const char *line)
  {
    (void)user_data;
    printf("Program log: %s\n", line);
  }

  void bc_log(const struct BcConfig *cfg, const char *fmt, ...)
  {
    if (!fmt)
      return;

    char line[BC_LOG_LINE_MAX];
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    // Encoding error: emit nothing rather than an undefined buffer
    if (n < 0)
      return;

    if (cfg && cfg->log)
    {
      cfg->log(cfg->log_user_data, line);
      return;
    }

    bc_log_stdout(nullptr, line);
  }

}  // extern "C"
