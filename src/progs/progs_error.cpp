#include "progs/progs_error.h"

QString progs_error_kind_name(ProgsErrorKind kind) {
  switch (kind) {
    case ProgsErrorKind::None:
      return "none";
    case ProgsErrorKind::IoError:
      return "io-error";
    case ProgsErrorKind::TruncatedInput:
      return "truncated-input";
    case ProgsErrorKind::InvalidEnumValue:
      return "invalid-enum-value";
    case ProgsErrorKind::BadOffset:
      return "bad-offset";
  }
  return "unknown";
}

bool fail_progs(ProgsError* error, ProgsErrorKind kind, const QString& message) {
  if (error) {
    error->kind = kind;
    error->message = message;
  }
  return false;
}

void prefix_progs_error(ProgsError* error, const QString& context) {
  if (!error || error->ok() || context.isEmpty()) {
    return;
  }
  error->message = error->message.isEmpty() ? context : context + ": " + error->message;
}

QString describe_progs_error(const ProgsError& error) {
  if (error.ok()) {
    return {};
  }
  if (error.message.isEmpty()) {
    return progs_error_kind_name(error.kind);
  }
  return QString("%1 (%2)").arg(error.message, progs_error_kind_name(error.kind));
}
