#include "progs/progs.h"

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include "progs/progs_reader.h"

namespace {
template <typename Record, typename ReadRecord>
bool read_record_lump(ProgsReader& reader,
                      const ProgsHeader& header,
                      ProgsLumpId id,
                      int record_size,
                      ReadRecord read_record,
                      QVector<Record>* out,
                      ProgsError* error) {
  const ProgsLump& lump = header.lump(id);
  const QString lump_name = progs_lump_name(id);

  const qint64 need = static_cast<qint64>(lump.count) * record_size;
  if (static_cast<qint64>(lump.offset) + need > reader.size()) {
    return fail_progs(error,
                      ProgsErrorKind::TruncatedInput,
                      QString("%1 lump at offset %2 needs %3 bytes but the input has %4.")
                        .arg(lump_name)
                        .arg(lump.offset)
                        .arg(need)
                        .arg(reader.size()));
  }
  if (!reader.seek(lump.offset, error)) {
    prefix_progs_error(error, QString("%1 lump").arg(lump_name));
    return false;
  }

  QVector<Record> records;
  records.reserve(static_cast<qsizetype>(lump.count));
  for (quint32 i = 0; i < lump.count; ++i) {
    Record record;
    if (!read_record(reader, &record, error)) {
      prefix_progs_error(error, QString("%1 lump, record %2").arg(lump_name).arg(i));
      return false;
    }
    records.push_back(std::move(record));
  }

  *out = std::move(records);
  return true;
}

bool read_byte_lump(ProgsReader& reader, const ProgsHeader& header, ProgsLumpId id, QByteArray* out, ProgsError* error) {
  const ProgsLump& lump = header.lump(id);
  const QString context = QString("%1 lump at offset %2").arg(progs_lump_name(id)).arg(lump.offset);
  if (!reader.seek(lump.offset, error) || !reader.read_bytes(lump.count, out, error)) {
    prefix_progs_error(error, context);
    return false;
  }
  return true;
}

[[nodiscard]] const ProgsDefinition* find_definition(const Progs& progs,
                                                     const QVector<ProgsDefinition>& defs,
                                                     const QString& name) {
  for (const ProgsDefinition& def : defs) {
    const std::optional<QString> def_name = progs.definition_name(def);
    if (def_name && *def_name == name) {
      return &def;
    }
  }
  return nullptr;
}
}  // namespace

Progs::Progs(ProgsHeader header,
             ProgsStringTable strings,
             ProgsGlobalBlob globals,
             QVector<ProgsFunction> functions,
             QVector<ProgsStatement> statements,
             QVector<ProgsDefinition> global_defs,
             QVector<ProgsDefinition> field_defs)
    : header_(header),
      strings_(std::move(strings)),
      globals_(std::move(globals)),
      functions_(std::move(functions)),
      statements_(std::move(statements)),
      global_defs_(std::move(global_defs)),
      field_defs_(std::move(field_defs)) {}

std::optional<QString> Progs::read_string(qint64 offset, ProgsError* error) const {
  return strings_.resolve(offset, error);
}

std::optional<ProgsValue> Progs::read_global(qint64 offset, ProgsType type, ProgsError* error) const {
  return globals_.read(offset, type, strings_, functions_, error);
}

std::optional<QString> Progs::function_name(const ProgsFunction& fn, ProgsError* error) const {
  return strings_.resolve(fn.s_name, error);
}

std::optional<QString> Progs::function_file(const ProgsFunction& fn, ProgsError* error) const {
  return strings_.resolve(fn.s_file, error);
}

std::optional<QString> Progs::definition_name(const ProgsDefinition& def, ProgsError* error) const {
  return strings_.resolve(def.s_name, error);
}

std::optional<ProgsValue> Progs::definition_value(const ProgsDefinition& def, ProgsError* error) const {
  return read_global(def.ofs, def.type, error);
}

const ProgsFunction* Progs::function_at(int index) const {
  if (index < 0 || index >= functions_.size()) {
    return nullptr;
  }
  return &functions_[index];
}

const ProgsFunction* Progs::find_function(const QString& name) const {
  for (const ProgsFunction& fn : functions_) {
    const std::optional<QString> fn_name = function_name(fn);
    if (fn_name && *fn_name == name) {
      return &fn;
    }
  }
  return nullptr;
}

const ProgsDefinition* Progs::find_global(const QString& name) const {
  return find_definition(*this, global_defs_, name);
}

const ProgsDefinition* Progs::find_field(const QString& name) const {
  return find_definition(*this, field_defs_, name);
}

QHash<int, int> Progs::function_entry_points() const {
  QHash<int, int> out;
  for (int i = 0; i < functions_.size(); ++i) {
    const ProgsFunction& fn = functions_[i];
    if (fn.is_builtin()) {
      continue;
    }
    out.insert(fn.first_statement, i);
  }
  return out;
}

std::optional<Progs> load_progs(QIODevice* device, ProgsError* error) {
  if (error) {
    error->clear();
  }
  if (!device || !device->isOpen() || !device->isReadable()) {
    fail_progs(error, ProgsErrorKind::IoError, "Progs source is not open for reading.");
    return std::nullopt;
  }
  if (device->isSequential()) {
    fail_progs(error, ProgsErrorKind::IoError, "Progs source must be seekable.");
    return std::nullopt;
  }

  ProgsReader reader(device);
  ProgsHeader header;
  if (!reader.seek(0, error) || !parse_progs_header(reader, &header, error)) {
    return std::nullopt;
  }
  if (header.version != kProgsStandardVersion) {
    qWarning().noquote() << QString("ProgsLoader: unexpected progs version %1 (expected %2)")
                              .arg(header.version)
                              .arg(kProgsStandardVersion);
  }

  QByteArray string_bytes;
  if (!read_byte_lump(reader, header, ProgsLumpId::Strings, &string_bytes, error)) {
    return std::nullopt;
  }

  QByteArray global_bytes;
  if (!read_byte_lump(reader, header, ProgsLumpId::Globals, &global_bytes, error)) {
    return std::nullopt;
  }

  QVector<ProgsFunction> functions;
  if (!read_record_lump(reader, header, ProgsLumpId::Functions, kProgsFunctionRecordSize, read_progs_function,
                        &functions, error)) {
    return std::nullopt;
  }

  QVector<ProgsStatement> statements;
  if (!read_record_lump(reader, header, ProgsLumpId::Statements, kProgsStatementRecordSize, read_progs_statement,
                        &statements, error)) {
    return std::nullopt;
  }

  QVector<ProgsDefinition> global_defs;
  if (!read_record_lump(reader, header, ProgsLumpId::GlobalDefs, kProgsDefinitionRecordSize, read_progs_definition,
                        &global_defs, error)) {
    return std::nullopt;
  }

  QVector<ProgsDefinition> field_defs;
  if (!read_record_lump(reader, header, ProgsLumpId::FieldDefs, kProgsDefinitionRecordSize, read_progs_definition,
                        &field_defs, error)) {
    return std::nullopt;
  }

  qInfo().noquote() << QString("ProgsLoader: version %1 crc %2, %3 functions, %4 statements, %5 globals, %6 fields")
                         .arg(header.version)
                         .arg(header.crc)
                         .arg(functions.size())
                         .arg(statements.size())
                         .arg(global_defs.size())
                         .arg(field_defs.size());

  return Progs(header,
               ProgsStringTable(std::move(string_bytes)),
               ProgsGlobalBlob(std::move(global_bytes)),
               std::move(functions),
               std::move(statements),
               std::move(global_defs),
               std::move(field_defs));
}

std::optional<Progs> load_progs_bytes(const QByteArray& bytes, ProgsError* error) {
  QBuffer buffer;
  buffer.setData(bytes);
  if (!buffer.open(QIODevice::ReadOnly)) {
    fail_progs(error, ProgsErrorKind::IoError, "Unable to open progs buffer.");
    return std::nullopt;
  }
  return load_progs(&buffer, error);
}

std::optional<Progs> load_progs_file(const QString& file_path, ProgsError* error) {
  if (error) {
    error->clear();
  }
  const QFileInfo info(file_path);
  if (!info.exists() || !info.isFile()) {
    fail_progs(error, ProgsErrorKind::IoError, QString("Progs file not found: %1").arg(file_path));
    return std::nullopt;
  }

  QFile file(info.absoluteFilePath());
  if (!file.open(QIODevice::ReadOnly)) {
    fail_progs(error, ProgsErrorKind::IoError, QString("Unable to open progs file: %1").arg(file_path));
    return std::nullopt;
  }
  return load_progs(&file, error);
}
