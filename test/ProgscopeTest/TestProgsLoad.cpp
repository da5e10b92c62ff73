#include <gtest/gtest.h>

#include <QBuffer>
#include <QFile>
#include <QTemporaryDir>

#include "ProgsTestImage.h"
#include "progs/progs.h"

TEST(ProgsLoad, DecodesEveryLump) {
  ProgsHeader header;
  const QByteArray image = sample_progs_builder().build(&header);

  ProgsError error;
  const std::optional<Progs> progs = load_progs_bytes(image, &error);
  ASSERT_TRUE(progs.has_value()) << error.message.toStdString();
  EXPECT_TRUE(error.ok());

  EXPECT_EQ(progs->version(), 6u);
  EXPECT_EQ(progs->crc(), 5927u);
  EXPECT_EQ(progs->header().lump(ProgsLumpId::Functions).offset, header.lump(ProgsLumpId::Functions).offset);
  EXPECT_EQ(progs->functions().size(), 4);
  EXPECT_EQ(progs->statements().size(), 5);
  EXPECT_EQ(progs->global_defs().size(), 8);
  EXPECT_EQ(progs->field_defs().size(), 2);
  EXPECT_EQ(progs->globals().size(), 32);

  const ProgsFunction& main_fn = progs->functions()[2];
  EXPECT_EQ(progs->function_name(main_fn).value_or(QString()).toStdString(), "main");
  EXPECT_EQ(progs->function_file(main_fn).value_or(QString()).toStdString(), "world.qc");
  EXPECT_EQ(main_fn.parm_size, (QVector<quint8>{1, 3}));
  EXPECT_EQ(main_fn.parm_start, 40u);
  EXPECT_EQ(main_fn.locals, 3u);

  EXPECT_EQ(progs->statements()[1].op, ProgsOp::AddF);
  EXPECT_EQ(progs->statements()[2].op, ProgsOp::Call1);

  const ProgsDefinition& time_def = progs->global_defs()[0];
  EXPECT_EQ(time_def.type, ProgsType::Float);
  EXPECT_TRUE(time_def.save_global);
  EXPECT_EQ(progs->definition_name(time_def).value_or(QString()).toStdString(), "time");
}

TEST(ProgsLoad, ValuesResolveThroughTheAggregate) {
  const std::optional<Progs> progs = load_progs_bytes(sample_progs_builder().build());
  ASSERT_TRUE(progs.has_value());

  const ProgsDefinition* msg = progs->find_global("msg");
  ASSERT_NE(msg, nullptr);
  const std::optional<ProgsValue> msg_value = progs->definition_value(*msg);
  ASSERT_TRUE(msg_value.has_value());
  ASSERT_TRUE(std::holds_alternative<QString>(*msg_value));
  EXPECT_EQ(std::get<QString>(*msg_value).toStdString(), "hello");

  const ProgsDefinition* main_fn = progs->find_global("main_fn");
  ASSERT_NE(main_fn, nullptr);
  const std::optional<ProgsValue> fn_value = progs->definition_value(*main_fn);
  ASSERT_TRUE(fn_value.has_value());
  ASSERT_TRUE(std::holds_alternative<ProgsFunctionRef>(*fn_value));
  EXPECT_EQ(std::get<ProgsFunctionRef>(*fn_value).index, 2);

  const std::optional<ProgsValue> time_value = progs->read_global(0, ProgsType::Float);
  ASSERT_TRUE(time_value.has_value());
  EXPECT_FLOAT_EQ(std::get<float>(*time_value), 1.0f);

  ProgsError error;
  EXPECT_FALSE(progs->definition_value(*progs->find_global("far"), &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::BadOffset);

  error.clear();
  EXPECT_FALSE(progs->read_string(100000, &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::BadOffset);
}

TEST(ProgsLoad, NameLookups) {
  const std::optional<Progs> progs = load_progs_bytes(sample_progs_builder().build());
  ASSERT_TRUE(progs.has_value());

  const ProgsFunction* think = progs->find_function("think");
  ASSERT_NE(think, nullptr);
  EXPECT_EQ(think->first_statement, 3);
  EXPECT_EQ(progs->find_function("missing"), nullptr);

  const ProgsDefinition* origin = progs->find_global("origin");
  ASSERT_NE(origin, nullptr);
  EXPECT_EQ(origin->type, ProgsType::Vector);

  const ProgsDefinition* health = progs->find_field("health");
  ASSERT_NE(health, nullptr);
  EXPECT_EQ(health->type, ProgsType::Float);
  EXPECT_EQ(progs->find_field("time"), nullptr);

  EXPECT_EQ(progs->function_at(1)->first_statement, -1);
  EXPECT_EQ(progs->function_at(4), nullptr);
  EXPECT_EQ(progs->function_at(-1), nullptr);
}

TEST(ProgsLoad, EntryPointsSkipBuiltinsAndLaterFunctionsWin) {
  ProgsImageBuilder builder = sample_progs_builder();
  TestFunctionRecord alias;
  alias.first_statement = 3;
  alias.s_name = builder.add_string("think_alias");
  builder.functions << alias;

  const std::optional<Progs> progs = load_progs_bytes(builder.build());
  ASSERT_TRUE(progs.has_value());

  const QHash<int, int> entries = progs->function_entry_points();
  EXPECT_EQ(entries.size(), 2);
  EXPECT_EQ(entries.value(1, -1), 2);
  EXPECT_EQ(entries.value(3, -1), 4);
  EXPECT_FALSE(entries.contains(0));
}

TEST(ProgsLoad, TruncatedImageFails) {
  QByteArray image = sample_progs_builder().build();
  image.chop(10);

  ProgsError error;
  EXPECT_FALSE(load_progs_bytes(image, &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::TruncatedInput);
  EXPECT_TRUE(error.message.contains("globals"));
}

TEST(ProgsLoad, HeaderOnlyImageFails) {
  QByteArray image = sample_progs_builder().build();
  image.truncate(20);

  ProgsError error;
  EXPECT_FALSE(load_progs_bytes(image, &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::TruncatedInput);
}

TEST(ProgsLoad, LumpOffsetPastTheEndFails) {
  QByteArray image = sample_progs_builder().build();
  patch_u32(image, lump_entry_pos(ProgsLumpId::Functions), 0xFFFFFF00u);

  ProgsError error;
  EXPECT_FALSE(load_progs_bytes(image, &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::TruncatedInput);
  EXPECT_TRUE(error.message.contains("functions"));
}

TEST(ProgsLoad, OversizedRecordCountFailsBeforeReading) {
  QByteArray image = sample_progs_builder().build();
  patch_u32(image, lump_entry_pos(ProgsLumpId::Statements) + 4, 0x7FFFFFFFu);

  ProgsError error;
  EXPECT_FALSE(load_progs_bytes(image, &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::TruncatedInput);
  EXPECT_TRUE(error.message.contains("statements"));
}

TEST(ProgsLoad, BadOpcodeFailsTheWholeLoad) {
  ProgsImageBuilder builder = sample_progs_builder();
  builder.statements[2].op = 66;

  ProgsError error;
  EXPECT_FALSE(load_progs_bytes(builder.build(), &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::InvalidEnumValue);
  EXPECT_TRUE(error.message.contains("statements lump, record 2"));
}

TEST(ProgsLoad, BadFieldTypeFailsTheWholeLoad) {
  ProgsImageBuilder builder = sample_progs_builder();
  builder.field_defs[1].packed_type = 0x7FFF;

  ProgsError error;
  EXPECT_FALSE(load_progs_bytes(builder.build(), &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::InvalidEnumValue);
  EXPECT_TRUE(error.message.contains("field_defs"));
}

TEST(ProgsLoad, LoadsFromFile) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = dir.filePath("progs.dat");
  {
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    const QByteArray image = sample_progs_builder().build();
    ASSERT_EQ(file.write(image), image.size());
  }

  ProgsError error;
  const std::optional<Progs> progs = load_progs_file(path, &error);
  ASSERT_TRUE(progs.has_value()) << error.message.toStdString();
  EXPECT_EQ(progs->functions().size(), 4);
}

TEST(ProgsLoad, MissingFileIsAnIoError) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());

  ProgsError error;
  EXPECT_FALSE(load_progs_file(dir.filePath("nope.dat"), &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::IoError);
}

TEST(ProgsLoad, ClosedDeviceIsAnIoError) {
  QBuffer buffer;
  buffer.setData(sample_progs_builder().build());

  ProgsError error;
  EXPECT_FALSE(load_progs(&buffer, &error).has_value());
  EXPECT_EQ(error.kind, ProgsErrorKind::IoError);
}
