#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QVector>

#include <optional>

#include "progs/progs_error.h"
#include "progs/progs_global_blob.h"
#include "progs/progs_header.h"
#include "progs/progs_records.h"
#include "progs/progs_string_table.h"
#include "progs/progs_value.h"

class QIODevice;

// A fully decoded progs.dat. Immutable once built; records carry raw
// offsets and every name or value lookup goes through this object.
class Progs {
public:
  Progs() = default;
  Progs(ProgsHeader header,
        ProgsStringTable strings,
        ProgsGlobalBlob globals,
        QVector<ProgsFunction> functions,
        QVector<ProgsStatement> statements,
        QVector<ProgsDefinition> global_defs,
        QVector<ProgsDefinition> field_defs);

  [[nodiscard]] quint32 version() const { return header_.version; }
  [[nodiscard]] quint32 crc() const { return header_.crc; }
  [[nodiscard]] const ProgsHeader& header() const { return header_; }

  [[nodiscard]] const ProgsStringTable& strings() const { return strings_; }
  [[nodiscard]] const ProgsGlobalBlob& globals() const { return globals_; }
  [[nodiscard]] const QVector<ProgsFunction>& functions() const { return functions_; }
  [[nodiscard]] const QVector<ProgsStatement>& statements() const { return statements_; }
  [[nodiscard]] const QVector<ProgsDefinition>& global_defs() const { return global_defs_; }
  [[nodiscard]] const QVector<ProgsDefinition>& field_defs() const { return field_defs_; }

  [[nodiscard]] std::optional<QString> read_string(qint64 offset, ProgsError* error = nullptr) const;
  [[nodiscard]] std::optional<ProgsValue> read_global(qint64 offset, ProgsType type, ProgsError* error = nullptr) const;

  [[nodiscard]] std::optional<QString> function_name(const ProgsFunction& fn, ProgsError* error = nullptr) const;
  [[nodiscard]] std::optional<QString> function_file(const ProgsFunction& fn, ProgsError* error = nullptr) const;
  [[nodiscard]] std::optional<QString> definition_name(const ProgsDefinition& def, ProgsError* error = nullptr) const;
  // Current value of a global definition, read at its ofs.
  [[nodiscard]] std::optional<ProgsValue> definition_value(const ProgsDefinition& def,
                                                           ProgsError* error = nullptr) const;

  [[nodiscard]] const ProgsFunction* function_at(int index) const;
  // First match by resolved name; nullptr when absent.
  [[nodiscard]] const ProgsFunction* find_function(const QString& name) const;
  [[nodiscard]] const ProgsDefinition* find_global(const QString& name) const;
  [[nodiscard]] const ProgsDefinition* find_field(const QString& name) const;

  // Statement index -> index of the function that starts there. Builtins
  // are skipped; when two functions share an entry the later one wins.
  // The null function is skipped too, so statement 0 never gets a banner.
  [[nodiscard]] QHash<int, int> function_entry_points() const;

private:
  ProgsHeader header_;
  ProgsStringTable strings_;
  ProgsGlobalBlob globals_;
  QVector<ProgsFunction> functions_;
  QVector<ProgsStatement> statements_;
  QVector<ProgsDefinition> global_defs_;
  QVector<ProgsDefinition> field_defs_;
};

// Decodes a complete progs image. The device must be open and seekable.
// On failure nothing is returned and *error names the failing lump.
[[nodiscard]] std::optional<Progs> load_progs(QIODevice* device, ProgsError* error = nullptr);
[[nodiscard]] std::optional<Progs> load_progs_bytes(const QByteArray& bytes, ProgsError* error = nullptr);
[[nodiscard]] std::optional<Progs> load_progs_file(const QString& file_path, ProgsError* error = nullptr);
