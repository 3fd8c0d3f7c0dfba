#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>
#include <cstring>

#include "bytecalc/calc_api.h"
#include "bytecalc/log.h"
#include "bytecalc/log.hpp"
#include "doctest.h"

// Test helper: custom log handler
static bool g_log_called = false;
static void *g_log_user_data = nullptr;
static char g_last_line[BC_LOG_LINE_MAX];

static void test_log_handler(void *user_data, const char *line)
{
  g_log_called = true;
  g_log_user_data = user_data;
  std::strncpy(g_last_line, line, sizeof(g_last_line) - 1);
  g_last_line[sizeof(g_last_line) - 1] = '\0';
}

static void reset_capture()
{
  g_log_called = false;
  g_log_user_data = nullptr;
  g_last_line[0] = '\0';
}

TEST_CASE("Default config")
{
  BcConfig cfg;
  std::memset(&cfg, 0xA5, sizeof(cfg));
  bc_config_default(&cfg);

  CHECK(cfg.overflow == BC_OVERFLOW_TRAP);
  CHECK((cfg.log == nullptr));
  CHECK(cfg.log_user_data == nullptr);

  // NULL-safe
  bc_config_default(nullptr);
}

TEST_CASE("Custom log handler: formatted line and user data")
{
  BcConfig cfg;
  bc_config_default(&cfg);
  reset_capture();

  int user_value = 42;
  bytecalc::set_log_handler(&cfg, test_log_handler, &user_value);

  bc_log(&cfg, "Result = %d", 15);

  CHECK(g_log_called == true);
  CHECK(g_log_user_data == &user_value);
  CHECK(std::strcmp(g_last_line, "Result = 15") == 0);
}

TEST_CASE("Custom log handler: long lines are truncated")
{
  BcConfig cfg;
  bc_config_default(&cfg);
  bytecalc::set_log_handler(&cfg, test_log_handler);
  reset_capture();

  char long_text[BC_LOG_LINE_MAX * 2];
  std::memset(long_text, 'x', sizeof(long_text) - 1);
  long_text[sizeof(long_text) - 1] = '\0';

  bc_log(&cfg, "%s", long_text);

  CHECK(g_log_called == true);
  CHECK(std::strlen(g_last_line) == BC_LOG_LINE_MAX - 1);
}

TEST_CASE("Custom log handler: cleared handler falls back to stdout")
{
  BcConfig cfg;
  bc_config_default(&cfg);
  bytecalc::set_log_handler(&cfg, test_log_handler);
  bytecalc::set_log_handler(&cfg, nullptr);
  reset_capture();

  // Prints "Program log: fallback" - should not reach the handler
  bc_log(&cfg, "fallback");

  CHECK(g_log_called == false);
}

TEST_CASE("NULL config logs to stdout")
{
  reset_capture();

  // Expected output:
  // Program log: no config
  bc_log(nullptr, "no config");
  bc_log_stdout(nullptr, "direct");

  CHECK(g_log_called == false);
}

TEST_CASE("set_log_handler is NULL-safe")
{
  bytecalc::set_log_handler(nullptr, test_log_handler);
}
