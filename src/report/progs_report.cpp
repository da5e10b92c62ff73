#include "report/progs_report.h"

#include <type_traits>

#include "progs/progs_disassembler.h"
#include "progs/progs_types.h"

namespace {
QString lookup_text(const std::optional<QString>& value, const ProgsError& error) {
  if (value) {
    return *value;
  }
  return QString("<error: %1>").arg(error.message);
}

QString function_label(const Progs& progs, const ProgsFunction& fn) {
  ProgsError err;
  return lookup_text(progs.function_name(fn, &err), err);
}

QString function_file_label(const Progs& progs, const ProgsFunction& fn) {
  ProgsError err;
  return lookup_text(progs.function_file(fn, &err), err);
}

// Nine significant digits round-trip any f32.
QString format_progs_float(float v) {
  return QString::number(v, 'g', 9);
}

QString definition_label(const Progs& progs, const ProgsDefinition& def) {
  ProgsError err;
  return lookup_text(progs.definition_name(def, &err), err);
}
}  // namespace

QString format_progs_value(const Progs& progs, const ProgsValue& value) {
  return std::visit(
    [&progs](const auto& v) -> QString {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, QString>) {
        return QString("\"%1\"").arg(v);
      } else if constexpr (std::is_same_v<T, float>) {
        return format_progs_float(v);
      } else if constexpr (std::is_same_v<T, ProgsVec3>) {
        return QString("'%1 %2 %3'").arg(format_progs_float(v.x), format_progs_float(v.y), format_progs_float(v.z));
      } else if constexpr (std::is_same_v<T, ProgsEntityRef>) {
        return QString("entity %1").arg(v.index);
      } else if constexpr (std::is_same_v<T, ProgsFunctionRef>) {
        return function_label(progs, v.function) + "()";
      } else {
        return QString("<%1>").arg(v.description);
      }
    },
    value);
}

QStringList progs_header_lines(const Progs& progs) {
  QStringList out;
  out << QString("Version: %1").arg(progs.version());
  out << QString("CRC: %1").arg(progs.crc());
  for (int i = 0; i < kProgsLumpCount; ++i) {
    const ProgsLumpId id = static_cast<ProgsLumpId>(i);
    const ProgsLump& lump = progs.header().lump(id);
    out << QString("Lump %1: offset=%2 count=%3").arg(progs_lump_name(id)).arg(lump.offset).arg(lump.count);
  }
  return out;
}

QStringList progs_function_lines(const Progs& progs) {
  QStringList out;
  out.reserve(progs.functions().size());
  for (const ProgsFunction& fn : progs.functions()) {
    QString line = function_label(progs, fn) + ' ' + function_file_label(progs, fn);
    if (fn.first_statement < 0) {
      line += QString(" [builtin #%1]").arg(-fn.first_statement);
    }
    out << line;
  }
  return out;
}

QStringList progs_statement_lines(const Progs& progs) {
  const QHash<int, int> entry_points = progs.function_entry_points();
  const QVector<ProgsStatement>& statements = progs.statements();

  QStringList out;
  out.reserve(statements.size() + entry_points.size());
  for (int i = 0; i < statements.size(); ++i) {
    const auto it = entry_points.constFind(i);
    if (it != entry_points.constEnd()) {
      const ProgsFunction* fn = progs.function_at(it.value());
      if (fn) {
        out << QString("// %1 : %2").arg(function_file_label(progs, *fn), function_label(progs, *fn));
      }
    }
    out << format_progs_statement(statements[i]);
  }
  return out;
}

QStringList progs_global_lines(const Progs& progs) {
  QStringList out;
  out.reserve(progs.global_defs().size());
  for (const ProgsDefinition& def : progs.global_defs()) {
    ProgsError err;
    const std::optional<ProgsValue> value = progs.definition_value(def, &err);
    const QString value_text = value ? format_progs_value(progs, *value) : QString("<error: %1>").arg(err.message);
    out << QString("%1 %2 @%3 = %4")
             .arg(progs_type_name(def.type), definition_label(progs, def), QString::number(def.ofs), value_text);
  }
  return out;
}

QStringList progs_field_lines(const Progs& progs) {
  QStringList out;
  out.reserve(progs.field_defs().size());
  for (const ProgsDefinition& def : progs.field_defs()) {
    out << QString("%1 .%2 @%3").arg(progs_type_name(def.type), definition_label(progs, def), QString::number(def.ofs));
  }
  return out;
}

QStringList build_progs_report(const Progs& progs, const ProgsReportOptions& options) {
  QStringList out;
  const auto section = [&out](const QString& title, const QStringList& lines) {
    if (!out.isEmpty()) {
      out << QString();
    }
    out << QString("== %1 (%2) ==").arg(title).arg(lines.size());
    out << lines;
  };

  if (options.header) {
    section("Header", progs_header_lines(progs));
  }
  if (options.functions) {
    section("Functions", progs_function_lines(progs));
  }
  if (options.statements) {
    section("Statements", progs_statement_lines(progs));
  }
  if (options.globals) {
    section("Globals", progs_global_lines(progs));
  }
  if (options.fields) {
    section("Fields", progs_field_lines(progs));
  }
  return out;
}
