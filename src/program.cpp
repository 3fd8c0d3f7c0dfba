#include <inttypes.h>

#include "bytecalc/calc_api.h"
#include "bytecalc/errors.hpp"
#include "bytecalc/log.h"

/* ========================================================================= */
/* Program entry point                                                       */
/* ========================================================================= */
/**
 * Host-facing wrapper: one payload in, one logged result out.
 * Decoding and evaluation are delegated to the codec and the core.
 */

extern "C" bc_err bc_process_instruction(const BcConfig *cfg, const bc_u8 *data,
                                         size_t len, bc_i64 *out)
{
  BcInstruction instr;
  if (bc_err e = bc_decode(data, len, &instr))
  {
    if (e == BC_ERR(DecodeError))
      bc_log(cfg, "Invalid instruction data (%zu bytes)", len);
    return e;
  }

  bc_i64 result = 0;
  if (bc_err e = bc_evaluate(cfg, &instr, &result))
    return e;

  bc_log(cfg, "Result = %" PRId64, result);

  if (out)
    *out = result;
  return BC_ERR(OK);
}
