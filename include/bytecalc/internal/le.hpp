#pragma once
#include <stdint.h>

#include "bytecalc/calc_api.h"

/**
 * Little-endian helpers for the instruction codec.
 * Callers check bounds; these only move bytes.
 */

static inline bc_i64 bc_read_i64_le(const bc_u8 *p)
{
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i)
    v = (v << 8) | (uint64_t)p[i];
  return (bc_i64)v;
}

static inline void bc_write_i64_le(bc_u8 *p, bc_i64 v)
{
  uint64_t u = (uint64_t)v;
  for (int i = 0; i < 8; ++i)
  {
    p[i] = (bc_u8)(u & 0xFF);
    u >>= 8;
  }
}
