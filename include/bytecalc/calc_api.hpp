/**
 * @file calc_api.hpp
 * @brief bytecalc C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "bytecalc/calc_api.h"
#include "bytecalc/errors.hpp"
#include "bytecalc/opcodes.hpp"

namespace bytecalc
{

using Instruction = BcInstruction;
using Config = BcConfig;

/**
 * @brief Build an instruction from a typed operation
 */
inline Instruction make_instruction(Op op, int64_t left, int64_t right)
{
  Instruction instr{};
  instr.operation = static_cast<uint8_t>(op);
  instr.left = left;
  instr.right = right;
  return instr;
}

/**
 * @brief Configuration with default values (trap on overflow, stdout log)
 */
inline Config default_config()
{
  Config cfg{};
  bc_config_default(&cfg);
  return cfg;
}

/**
 * @brief Decode a payload (see bc_decode)
 */
inline Err decode(const uint8_t *data, std::size_t len, Instruction *out)
{
  return static_cast<Err>(bc_decode(data, len, out));
}

/**
 * @brief Encode an instruction into a fixed-size buffer (see bc_encode)
 */
inline Err encode(const Instruction &instr, uint8_t (&out)[BC_INSTRUCTION_SIZE])
{
  return static_cast<Err>(bc_encode(&instr, out, sizeof(out), nullptr));
}

/**
 * @brief Evaluate an instruction (see bc_evaluate)
 */
inline Err evaluate(const Instruction &instr, int64_t *out, const Config *cfg = nullptr)
{
  return static_cast<Err>(bc_evaluate(cfg, &instr, out));
}

/**
 * @brief Run the program entry point on a payload (see bc_process_instruction)
 */
inline Err process_instruction(const uint8_t *data, std::size_t len,
                               int64_t *out = nullptr, const Config *cfg = nullptr)
{
  return static_cast<Err>(bc_process_instruction(cfg, data, len, out));
}

}  // namespace bytecalc
