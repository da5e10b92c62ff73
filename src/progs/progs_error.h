#pragma once

#include <QString>

enum class ProgsErrorKind {
  None = 0,
  IoError,
  TruncatedInput,
  InvalidEnumValue,
  BadOffset,
};

struct ProgsError {
  ProgsErrorKind kind = ProgsErrorKind::None;
  QString message;

  [[nodiscard]] bool ok() const { return kind == ProgsErrorKind::None; }
  void clear() {
    kind = ProgsErrorKind::None;
    message.clear();
  }
};

[[nodiscard]] QString progs_error_kind_name(ProgsErrorKind kind);

// Fills *error when error is non-null. Always returns false so callers can
// `return fail_progs(...)`.
bool fail_progs(ProgsError* error, ProgsErrorKind kind, const QString& message);

// Prepends "<context>: " to an existing error message.
void prefix_progs_error(ProgsError* error, const QString& context);

[[nodiscard]] QString describe_progs_error(const ProgsError& error);
