#pragma once

#include <QString>
#include <QtGlobal>

#include <array>

#include "progs/progs_error.h"

class ProgsReader;

// Lump order as stored in the header.
enum class ProgsLumpId {
  Statements = 0,
  GlobalDefs,
  FieldDefs,
  Functions,
  Strings,
  Globals,
};

constexpr int kProgsLumpCount = 6;
constexpr int kProgsHeaderSize = 8 + kProgsLumpCount * 8;
// Version written by the stock QuakeC compiler.
constexpr quint32 kProgsStandardVersion = 6;

struct ProgsLump {
  quint32 offset = 0;
  quint32 count = 0;  // Records for table lumps, bytes for strings/globals.
};

struct ProgsHeader {
  quint32 version = 0;
  quint32 crc = 0;
  std::array<ProgsLump, kProgsLumpCount> lumps{};

  [[nodiscard]] const ProgsLump& lump(ProgsLumpId id) const { return lumps[static_cast<int>(id)]; }
  [[nodiscard]] ProgsLump& lump(ProgsLumpId id) { return lumps[static_cast<int>(id)]; }
};

[[nodiscard]] QString progs_lump_name(ProgsLumpId id);

// Reads the header from the reader's current position. Offsets and counts
// are taken as-is.
[[nodiscard]] bool parse_progs_header(ProgsReader& reader, ProgsHeader* out, ProgsError* error);
