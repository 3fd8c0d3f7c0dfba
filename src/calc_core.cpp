#include <inttypes.h>
#include <stdint.h>

#include "bytecalc/calc_api.h"
#include "bytecalc/errors.hpp"
#include "bytecalc/log.h"
#include "bytecalc/opcodes.hpp"

/* Defaults used when a caller passes a NULL config */
static const BcConfig kDefaultConfig = {BC_OVERFLOW_TRAP, nullptr, nullptr};

extern "C" int bc_version(void)
{
  return 0;
}

extern "C" void bc_config_default(BcConfig* cfg)
{
  if (!cfg)
    return;

  *cfg = kDefaultConfig;
}

/* ========================== Overflow detection =========================== */

static inline bool add_overflows(bc_i64 a, bc_i64 b)
{
  return (b > 0 && a > INT64_MAX - b) || (b < 0 && a < INT64_MIN - b);
}

static inline bool sub_overflows(bc_i64 a, bc_i64 b)
{
  return (b < 0 && a > INT64_MAX + b) || (b > 0 && a < INT64_MIN + b);
}

static inline bool mul_overflows(bc_i64 a, bc_i64 b)
{
  if (a == 0 || b == 0)
    return false;

  if (a > 0)
  {
    if (b > 0)
      return a > INT64_MAX / b;
    return b < INT64_MIN / a;
  }

  if (b > 0)
    return a < INT64_MIN / b;
  return a < INT64_MAX / b;
}

/* ================ Two's-complement arithmetic (never UB) ================= */

static inline bc_i64 wrap_add(bc_i64 a, bc_i64 b)
{
  return (bc_i64)((uint64_t)a + (uint64_t)b);
}

static inline bc_i64 wrap_sub(bc_i64 a, bc_i64 b)
{
  return (bc_i64)((uint64_t)a - (uint64_t)b);
}

static inline bc_i64 wrap_mul(bc_i64 a, bc_i64 b)
{
  return (bc_i64)((uint64_t)a * (uint64_t)b);
}

/* Exponentiation by squaring. Squaring is skipped after the last bit, so a
 * trap is only reported when the final result does not fit. */
static bc_err int_pow(bc_i64 base, uint64_t exp, bool trap, bc_i64* out)
{
  bc_i64 acc = 1;
  while (exp > 0)
  {
    if (exp & 1u)
    {
      if (trap && mul_overflows(acc, base))
        return BC_ERR(ArithmeticOverflow);
      acc = wrap_mul(acc, base);
    }
    exp >>= 1;
    if (exp > 0)
    {
      if (trap && mul_overflows(base, base))
        return BC_ERR(ArithmeticOverflow);
      base = wrap_mul(base, base);
    }
  }
  *out = acc;
  return BC_ERR(OK);
}

static bc_err report_overflow(const BcConfig* cfg, const bytecalc::OperationEntry* entry)
{
  bc_log(cfg, "Arithmetic overflow in %s", entry->label);
  return BC_ERR(ArithmeticOverflow);
}

/* ============================== Evaluator ================================ */

extern "C" bc_err bc_evaluate(const BcConfig* cfg, const BcInstruction* instr, bc_i64* out)
{
  if (!instr || !out)
    return BC_ERR(InvalidArg);
  if (!cfg)
    cfg = &kDefaultConfig;

  const bytecalc::OperationEntry* entry = bytecalc::find_operation(instr->operation);
  if (!entry)
  {
    bc_log(cfg, "Unknown operation: %u", (unsigned)instr->operation);
    return BC_ERR(UnknownOperation);
  }

  const bc_i64 a = instr->left;
  const bc_i64 b = instr->right;
  const bool trap = cfg->overflow != BC_OVERFLOW_WRAP;

  bc_log(cfg, "%s: %" PRId64 " %s %" PRId64, entry->label, a, entry->symbol, b);

  bc_i64 r = 0;
  switch (static_cast<bytecalc::Op>(instr->operation))
  {
    case bytecalc::Op::Add:
      if (trap && add_overflows(a, b))
        return report_overflow(cfg, entry);
      r = wrap_add(a, b);
      break;

    case bytecalc::Op::Subtract:
      if (trap && sub_overflows(a, b))
        return report_overflow(cfg, entry);
      r = wrap_sub(a, b);
      break;

    case bytecalc::Op::Multiply:
      if (trap && mul_overflows(a, b))
        return report_overflow(cfg, entry);
      r = wrap_mul(a, b);
      break;

    case bytecalc::Op::Divide:
      if (b == 0)
      {
        bc_log(cfg, "Division by zero is not allowed");
        return BC_ERR(DivisionByZero);
      }
      // INT64_MIN / -1 is the only quotient that leaves the i64 range
      if (a == INT64_MIN && b == -1)
      {
        if (trap)
          return report_overflow(cfg, entry);
        r = INT64_MIN;
        break;
      }
      r = a / b;
      break;

    case bytecalc::Op::Modulo:
      if (b == 0)
      {
        bc_log(cfg, "Modulus by zero is not allowed");
        return BC_ERR(DivisionByZero);
      }
      if (a == INT64_MIN && b == -1)
      {
        if (trap)
          return report_overflow(cfg, entry);
        r = 0;
        break;
      }
      r = a % b;
      break;

    case bytecalc::Op::Power:
    {
      if (b < 0)
      {
        bc_log(cfg, "Negative exponent is not allowed");
        return BC_ERR(NegativeExponent);
      }

      // Exponent is a u32 on the wire contract; wider values are narrowed
      uint64_t exp = (uint64_t)b;
      if (exp > UINT32_MAX)
      {
        if (trap)
        {
          bc_log(cfg, "Exponent out of range: %" PRId64, b);
          return BC_ERR(ExponentOutOfRange);
        }
        exp &= 0xFFFFFFFFu;
      }

      if (int_pow(a, exp, trap, &r) != BC_ERR(OK))
        return report_overflow(cfg, entry);
      break;
    }
  }

  *out = r;
  return BC_ERR(OK);
}
