#include "progs/progs_global_blob.h"

#include "progs/progs_reader.h"

namespace {
bool fail_global_offset(ProgsError* error, qint64 offset, int width, qint64 size) {
  return fail_progs(error,
                    ProgsErrorKind::BadOffset,
                    QString("Global offset %1 (+%2 bytes) is outside the globals lump (%3 bytes).")
                      .arg(offset)
                      .arg(width)
                      .arg(size));
}
}  // namespace

bool ProgsGlobalBlob::read_u32(qint64 offset, quint32* out, ProgsError* error) const {
  if (!read_u32_le(bytes_, offset, out)) {
    return fail_global_offset(error, offset, 4, bytes_.size());
  }
  return true;
}

bool ProgsGlobalBlob::read_f32(qint64 offset, float* out, ProgsError* error) const {
  if (!read_f32_le(bytes_, offset, out)) {
    return fail_global_offset(error, offset, 4, bytes_.size());
  }
  return true;
}

std::optional<ProgsValue> ProgsGlobalBlob::read(qint64 offset,
                                                ProgsType type,
                                                const ProgsStringTable& strings,
                                                const QVector<ProgsFunction>& functions,
                                                ProgsError* error) const {
  switch (type) {
    case ProgsType::String: {
      quint32 str = 0;
      if (!read_u32(offset, &str, error)) {
        return std::nullopt;
      }
      std::optional<QString> text = strings.resolve(str, error);
      if (!text) {
        return std::nullopt;
      }
      return ProgsValue(std::move(*text));
    }
    case ProgsType::Float: {
      float f = 0.0f;
      if (!read_f32(offset, &f, error)) {
        return std::nullopt;
      }
      return ProgsValue(f);
    }
    case ProgsType::Vector: {
      if (offset < 0 || offset + 12 > bytes_.size()) {
        fail_global_offset(error, offset, 12, bytes_.size());
        return std::nullopt;
      }
      ProgsVec3 v;
      if (!read_f32(offset, &v.x, error) || !read_f32(offset + 4, &v.y, error) ||
          !read_f32(offset + 8, &v.z, error)) {
        return std::nullopt;
      }
      return ProgsValue(v);
    }
    case ProgsType::Entity: {
      ProgsEntityRef ent;
      if (!read_u32(offset, &ent.index, error)) {
        return std::nullopt;
      }
      return ProgsValue(ent);
    }
    case ProgsType::Function: {
      quint32 index = 0;
      if (!read_u32(offset, &index, error)) {
        return std::nullopt;
      }
      if (index >= static_cast<quint32>(functions.size())) {
        ProgsUnrepresentable bad;
        bad.reason = ProgsUnrepresentable::Reason::FunctionOutOfRange;
        bad.type = type;
        bad.raw = index;
        bad.description = QString("Invalid func %1").arg(index);
        return ProgsValue(std::move(bad));
      }
      ProgsFunctionRef ref;
      ref.index = static_cast<int>(index);
      ref.function = functions[ref.index];
      return ProgsValue(std::move(ref));
    }
    case ProgsType::Bad:
    case ProgsType::Void:
    case ProgsType::Field:
    case ProgsType::Pointer:
      break;
  }

  ProgsUnrepresentable unhandled;
  unhandled.reason = ProgsUnrepresentable::Reason::UnhandledType;
  unhandled.type = type;
  unhandled.description = QString("Unhandled type: %1").arg(progs_type_name(type));
  return ProgsValue(std::move(unhandled));
}
