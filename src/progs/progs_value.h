#pragma once

#include <QString>
#include <QtGlobal>

#include <variant>

#include "progs/progs_records.h"
#include "progs/progs_types.h"

struct ProgsVec3 {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

// Raw edict number; entity state is not available offline.
struct ProgsEntityRef {
  quint32 index = 0;
};

struct ProgsFunctionRef {
  int index = -1;
  ProgsFunction function;
};

// A global that could be located but not turned into a value.
struct ProgsUnrepresentable {
  enum class Reason {
    FunctionOutOfRange,
    UnhandledType,
  };

  Reason reason = Reason::UnhandledType;
  ProgsType type = ProgsType::Bad;
  quint32 raw = 0;  // Function index for FunctionOutOfRange.
  QString description;
};

using ProgsValue = std::variant<QString, float, ProgsVec3, ProgsEntityRef, ProgsFunctionRef, ProgsUnrepresentable>;

[[nodiscard]] inline bool is_representable(const ProgsValue& value) {
  return !std::holds_alternative<ProgsUnrepresentable>(value);
}
