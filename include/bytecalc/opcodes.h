#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief Arithmetic operation selectors for C.
   *
   *  One byte on the wire. Keep numeric values stable once published.
   */

  typedef enum bc_op_t
  {
#define OP(name, val, label, sym) BC_OP_##name = val,
#include "bytecalc/opcodes.def"
#undef OP
  } bc_op_t;

#ifdef __cplusplus
}  // extern "C"
#endif
