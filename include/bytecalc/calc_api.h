#pragma once
#include <stddef.h>
#include <stdint.h>

#include "bytecalc/log.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 64-bit signed integer operand/result type. */
  typedef int64_t bc_i64;
  /** 8-bit unsigned integer used for payload bytes. */
  typedef uint8_t bc_u8;
  /** Error code type. 0 = OK, negative = error. */
  typedef int bc_err;

  /** Encoded instruction size in bytes: op(1) + left(8) + right(8). */
#define BC_INSTRUCTION_SIZE 17

  /* ------------------------------------------------------------------------- */
  /* Instruction                                                               */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Decoded arithmetic instruction.
   *
   * Wire layout (little-endian):
   *   [0]     operation selector (u8, see opcodes.def)
   *   [1..8]  left operand (i64)
   *   [9..16] right operand (i64)
   */
  typedef struct BcInstruction
  {
    uint8_t operation; /**< Operation selector (0=add .. 5=pow) */
    bc_i64 left;       /**< First operand */
    bc_i64 right;      /**< Second operand (divisor / exponent) */
  } BcInstruction;

  /* ------------------------------------------------------------------------- */
  /* Configuration                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Behaviour when a result does not fit in 64 bits.
   */
  typedef enum BcOverflowPolicy
  {
    /** Fail with ArithmeticOverflow; exponents above UINT32_MAX fail with
     *  ExponentOutOfRange. */
    BC_OVERFLOW_TRAP = 0,
    /** Two's-complement wraparound; exponents are truncated to 32 bits. */
    BC_OVERFLOW_WRAP = 1,
  } BcOverflowPolicy;

  /**
   * @brief Per-call configuration.
   *
   * Passed by const pointer to every entry point; NULL selects the defaults
   * (trap on overflow, log to stdout).
   */
  typedef struct BcConfig
  {
    BcOverflowPolicy overflow; /**< Overflow policy */
    BcLogHandler log;          /**< Log handler (NULL = stdout) */
    void *log_user_data;       /**< User data passed to log handler */
  } BcConfig;

  /**
   * @brief Fill a configuration with default values.
   * @param cfg  Configuration to initialize (NULL-safe).
   */
  void bc_config_default(BcConfig *cfg);

  /* ------------------------------------------------------------------------- */
  /* Codec                                                                     */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Decode an instruction payload.
   *
   * The payload must be exactly BC_INSTRUCTION_SIZE bytes. The operation
   * selector is copied as-is; unknown selectors are rejected by bc_evaluate.
   *
   * @param data  Payload bytes (may be NULL only when len == 0).
   * @param len   Payload length in bytes.
   * @param out   Decoded instruction.
   * @return 0 on success, DecodeError on wrong length, InvalidArg on NULL.
   */
  bc_err bc_decode(const bc_u8 *data, size_t len, BcInstruction *out);

  /**
   * @brief Encode an instruction into its wire layout.
   * @param in       Instruction to encode.
   * @param out      Destination buffer.
   * @param cap      Destination capacity in bytes.
   * @param written  Receives the number of bytes written (can be NULL).
   * @return 0 on success, BufferTooSmall if cap < BC_INSTRUCTION_SIZE,
   *         InvalidArg on NULL.
   */
  bc_err bc_encode(const BcInstruction *in, bc_u8 *out, size_t cap, size_t *written);

  /* ------------------------------------------------------------------------- */
  /* Evaluation                                                                */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Evaluate a decoded instruction.
   *
   * Emits a trace line describing the operation before computing it.
   *
   * @param cfg    Configuration (NULL = defaults).
   * @param instr  Instruction to evaluate.
   * @param out    Receives the result on success.
   * @return 0 on success, or UnknownOperation, DivisionByZero,
   *         NegativeExponent, ArithmeticOverflow, ExponentOutOfRange,
   *         InvalidArg.
   */
  bc_err bc_evaluate(const BcConfig *cfg, const BcInstruction *instr, bc_i64 *out);

  /**
   * @brief Program entry point: decode, evaluate and log the result.
   *
   * Logs "Result = <n>" on success. Errors from decoding and evaluation are
   * returned unchanged.
   *
   * @param cfg   Configuration (NULL = defaults).
   * @param data  Instruction payload.
   * @param len   Payload length in bytes.
   * @param out   Receives the result on success (can be NULL).
   * @return 0 on success, negative error code on failure.
   */
  bc_err bc_process_instruction(const BcConfig *cfg, const bc_u8 *data, size_t len,
                                bc_i64 *out);

  /**
   * @brief Library ABI version.
   */
  int bc_version(void);

#ifdef __cplusplus
} /* extern "C" */
#endif
