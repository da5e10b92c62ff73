#include "progs/progs_reader.h"

#include <cstring>

#include <QIODevice>

namespace {
[[nodiscard]] quint16 u16_from(const char* p) {
  const quint16 b0 = static_cast<quint8>(p[0]);
  const quint16 b1 = static_cast<quint8>(p[1]);
  return static_cast<quint16>(b0 | (b1 << 8));
}

[[nodiscard]] quint32 u32_from(const char* p) {
  const quint32 b0 = static_cast<quint8>(p[0]);
  const quint32 b1 = static_cast<quint8>(p[1]);
  const quint32 b2 = static_cast<quint8>(p[2]);
  const quint32 b3 = static_cast<quint8>(p[3]);
  return (b0) | (b1 << 8) | (b2 << 16) | (b3 << 24);
}

[[nodiscard]] float f32_from(const char* p) {
  static_assert(sizeof(float) == sizeof(quint32), "Unexpected float size");
  const quint32 u = u32_from(p);
  float f = 0.0f;
  std::memcpy(&f, &u, sizeof(float));
  return f;
}

[[nodiscard]] bool in_bounds(const QByteArray& bytes, qint64 offset, qint64 len) {
  return offset >= 0 && len >= 0 && offset + len <= bytes.size();
}
}  // namespace

ProgsReader::ProgsReader(QIODevice* device) : device_(device) {}

qint64 ProgsReader::pos() const {
  return device_ ? device_->pos() : 0;
}

qint64 ProgsReader::size() const {
  return device_ ? device_->size() : 0;
}

bool ProgsReader::seek(qint64 pos, ProgsError* error) {
  if (!device_ || !device_->isReadable()) {
    return fail_progs(error, ProgsErrorKind::IoError, "Progs source is not readable.");
  }
  if (pos < 0 || pos > device_->size()) {
    return fail_progs(error,
                      ProgsErrorKind::TruncatedInput,
                      QString("Offset %1 is beyond the end of input (%2 bytes).").arg(pos).arg(device_->size()));
  }
  if (!device_->seek(pos)) {
    return fail_progs(error, ProgsErrorKind::TruncatedInput, QString("Unable to seek to offset %1.").arg(pos));
  }
  return true;
}

bool ProgsReader::read_exact(char* dst, int count, ProgsError* error) {
  if (!device_ || !device_->isReadable()) {
    return fail_progs(error, ProgsErrorKind::IoError, "Progs source is not readable.");
  }
  const qint64 at = device_->pos();
  const qint64 got = device_->read(dst, count);
  if (got != count) {
    return fail_progs(error,
                      ProgsErrorKind::TruncatedInput,
                      QString("Unexpected end of input at offset %1 (needed %2 bytes, got %3).")
                        .arg(at)
                        .arg(count)
                        .arg(got < 0 ? 0 : got));
  }
  return true;
}

bool ProgsReader::read_bytes(qint64 count, QByteArray* out, ProgsError* error) {
  if (!out) {
    return false;
  }
  out->clear();
  if (!device_ || !device_->isReadable()) {
    return fail_progs(error, ProgsErrorKind::IoError, "Progs source is not readable.");
  }
  const qint64 at = device_->pos();
  if (count < 0 || count > device_->size() - at) {
    return fail_progs(error,
                      ProgsErrorKind::TruncatedInput,
                      QString("Unexpected end of input at offset %1 (needed %2 bytes, %3 available).")
                        .arg(at)
                        .arg(count)
                        .arg(device_->size() - at));
  }
  QByteArray bytes = device_->read(count);
  if (bytes.size() != count) {
    return fail_progs(error,
                      ProgsErrorKind::TruncatedInput,
                      QString("Unexpected end of input at offset %1 (needed %2 bytes, got %3).")
                        .arg(at)
                        .arg(count)
                        .arg(bytes.size()));
  }
  *out = std::move(bytes);
  return true;
}

bool ProgsReader::read_u8(quint8* out, ProgsError* error) {
  char b = 0;
  if (!read_exact(&b, 1, error)) {
    return false;
  }
  if (out) {
    *out = static_cast<quint8>(b);
  }
  return true;
}

bool ProgsReader::read_u16(quint16* out, ProgsError* error) {
  char b[2];
  if (!read_exact(b, 2, error)) {
    return false;
  }
  if (out) {
    *out = u16_from(b);
  }
  return true;
}

bool ProgsReader::read_i16(qint16* out, ProgsError* error) {
  quint16 u = 0;
  if (!read_u16(&u, error)) {
    return false;
  }
  if (out) {
    *out = static_cast<qint16>(u);
  }
  return true;
}

bool ProgsReader::read_u32(quint32* out, ProgsError* error) {
  char b[4];
  if (!read_exact(b, 4, error)) {
    return false;
  }
  if (out) {
    *out = u32_from(b);
  }
  return true;
}

bool ProgsReader::read_i32(qint32* out, ProgsError* error) {
  quint32 u = 0;
  if (!read_u32(&u, error)) {
    return false;
  }
  if (out) {
    *out = static_cast<qint32>(u);
  }
  return true;
}

bool ProgsReader::read_f32(float* out, ProgsError* error) {
  char b[4];
  if (!read_exact(b, 4, error)) {
    return false;
  }
  if (out) {
    *out = f32_from(b);
  }
  return true;
}

bool read_u16_le(const QByteArray& bytes, qint64 offset, quint16* out) {
  if (!out || !in_bounds(bytes, offset, 2)) {
    return false;
  }
  *out = u16_from(bytes.constData() + offset);
  return true;
}

bool read_u32_le(const QByteArray& bytes, qint64 offset, quint32* out) {
  if (!out || !in_bounds(bytes, offset, 4)) {
    return false;
  }
  *out = u32_from(bytes.constData() + offset);
  return true;
}

bool read_i32_le(const QByteArray& bytes, qint64 offset, qint32* out) {
  quint32 u = 0;
  if (!out || !read_u32_le(bytes, offset, &u)) {
    return false;
  }
  *out = static_cast<qint32>(u);
  return true;
}

bool read_f32_le(const QByteArray& bytes, qint64 offset, float* out) {
  if (!out || !in_bounds(bytes, offset, 4)) {
    return false;
  }
  *out = f32_from(bytes.constData() + offset);
  return true;
}
