#pragma once

#include <QString>
#include <QStringList>

#include "progs/progs.h"
#include "progs/progs_value.h"

struct ProgsReportOptions {
  bool header = false;
  bool functions = true;
  bool statements = true;
  bool globals = true;
  bool fields = false;

  [[nodiscard]] bool any() const { return header || functions || statements || globals || fields; }
};

// Display form of a decoded value: quoted text, floats, 'x y z' vectors,
// "entity N", "name()" for functions and <...> for placeholders.
[[nodiscard]] QString format_progs_value(const Progs& progs, const ProgsValue& value);

// Version, crc and the lump directory.
[[nodiscard]] QStringList progs_header_lines(const Progs& progs);
// "<name> <file>" per function, tagged "[builtin #N]" for builtins.
[[nodiscard]] QStringList progs_function_lines(const Progs& progs);
// One disassembled line per statement, with "// <file> : <name>" before
// each function entry point.
[[nodiscard]] QStringList progs_statement_lines(const Progs& progs);
// "<type> <name> @<ofs> = <value>" per global definition.
[[nodiscard]] QStringList progs_global_lines(const Progs& progs);
// "<type> .<name> @<ofs>" per field definition.
[[nodiscard]] QStringList progs_field_lines(const Progs& progs);

[[nodiscard]] QStringList build_progs_report(const Progs& progs, const ProgsReportOptions& options);
