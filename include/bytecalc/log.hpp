/**
 * @file log.hpp
 * @brief bytecalc log channel C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "bytecalc/calc_api.h"
#include "bytecalc/log.h"

namespace bytecalc
{

/**
 * @brief C++ wrapper for BcLogHandler
 */
using LogHandler = BcLogHandler;

/**
 * @brief Route log lines of a configuration to a handler
 *
 * @param cfg        Configuration to update
 * @param handler    Log handler (nullptr restores the stdout sink)
 * @param user_data  User data passed to handler
 */
inline void set_log_handler(BcConfig *cfg, LogHandler handler, void *user_data = nullptr)
{
  if (!cfg)
    return;
  cfg->log = handler;
  cfg->log_user_data = user_data;
}

}  // namespace bytecalc
