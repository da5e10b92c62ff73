#pragma once

#include <QString>

#include "progs/progs_records.h"

// Renders one statement as a line of pseudo-assembly.
//
// Opcodes with a binary-operator row become
//   *(<result> *)<c> = *(<left> *)<a> <symbol> *(<right> *)<b>
// where a, b and c are the raw operand slots. Every other opcode (loads,
// stores, calls, jumps, control flow) falls back to a raw dump:
//   (<OPNAME>, <a>, <b>, <c>)
[[nodiscard]] QString format_progs_statement(const ProgsStatement& statement);

// The raw fallback form, usable for any statement.
[[nodiscard]] QString format_progs_statement_raw(const ProgsStatement& statement);
