#pragma once
#include <cstdint>

namespace bytecalc
{

/** Arithmetic operation selector (single byte on the wire). */
enum class Op : std::uint8_t
{
#define OP(name, val, label, sym) name = val,
#include "bytecalc/opcodes.def"
#undef OP
};

// -----------------------------------------------------------------------------
// Operation entry definition
// -----------------------------------------------------------------------------
struct OperationEntry
{
  const char* name;
  uint8_t selector;
  const char* label;   // trace label, e.g. "Addition"
  const char* symbol;  // infix symbol, e.g. "+"
};

// -----------------------------------------------------------------------------
// Operation table (generated from opcodes.def)
// -----------------------------------------------------------------------------
static constexpr OperationEntry kOperationTable[] = {
#define OP(name, val, label, sym) {#name, val, label, sym},
#include "bytecalc/opcodes.def"
#undef OP
};

static constexpr int kOperationCount =
    static_cast<int>(sizeof(kOperationTable) / sizeof(kOperationTable[0]));

/**
 * @brief Look up the table entry for a raw selector byte.
 * @return Entry pointer, or nullptr if the selector is not a known operation.
 */
inline const OperationEntry* find_operation(uint8_t selector)
{
  for (int i = 0; i < kOperationCount; ++i)
  {
    if (kOperationTable[i].selector == selector)
      return &kOperationTable[i];
  }
  return nullptr;
}

}  // namespace bytecalc
