#include "bytecalc/calc_api.h"
#include "bytecalc/errors.hpp"
#include "bytecalc/internal/le.hpp"

/* ========================================================================= */
/* Instruction wire codec                                                    */
/* ========================================================================= */
/**
 * Layout: op(u8) | left(i64 LE) | right(i64 LE), 17 bytes, nothing trailing.
 */

extern "C" bc_err bc_decode(const bc_u8 *data, size_t len, BcInstruction *out)
{
  if (!out || (!data && len != 0))
    return BC_ERR(InvalidArg);

  // Short reads and trailing bytes are both malformed
  if (len != BC_INSTRUCTION_SIZE)
    return BC_ERR(DecodeError);

  out->operation = data[0];
  out->left = bc_read_i64_le(data + 1);
  out->right = bc_read_i64_le(data + 9);
  return BC_ERR(OK);
}

extern "C" bc_err bc_encode(const BcInstruction *in, bc_u8 *out, size_t cap,
                            size_t *written)
{
  if (!in || !out)
    return BC_ERR(InvalidArg);

  if (cap < BC_INSTRUCTION_SIZE)
    return BC_ERR(BufferTooSmall);

  out[0] = in->operation;
  bc_write_i64_le(out + 1, in->left);
  bc_write_i64_le(out + 9, in->right);

  if (written)
    *written = BC_INSTRUCTION_SIZE;
  return BC_ERR(OK);
}
