#pragma once

// Error code definition using the same pattern as opcodes.def
// Define ERR(name, val, msg) before including this file if you want to extract text or
// mapping.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "bytecalc/errors.def"
};

#undef ERR

// Shorthand for returning a code through the C API
#define BC_ERR(name) static_cast<bc_err>(Err::name)

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "bytecalc/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}
