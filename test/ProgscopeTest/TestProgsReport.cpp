#include <gtest/gtest.h>

#include "ProgsTestImage.h"
#include "report/progs_report.h"

namespace {
Progs load_sample() {
  ProgsError error;
  std::optional<Progs> progs = load_progs_bytes(sample_progs_builder().build(), &error);
  EXPECT_TRUE(progs.has_value()) << error.message.toStdString();
  return progs.value_or(Progs());
}

QStringList expected(std::initializer_list<const char*> lines) {
  QStringList out;
  for (const char* line : lines) {
    out << QString::fromLatin1(line);
  }
  return out;
}
}  // namespace

TEST(ProgsReport, FunctionLines) {
  const Progs progs = load_sample();
  EXPECT_EQ(progs_function_lines(progs),
            expected({" ", "print defs.qc [builtin #1]", "main world.qc", "think world.qc"}));
}

TEST(ProgsReport, StatementLinesMarkEntryPoints) {
  const Progs progs = load_sample();
  EXPECT_EQ(progs_statement_lines(progs),
            expected({"(DONE, 0, 0, 0)",
                      "// world.qc : main",
                      "*(float *)3 = *(float *)1 + *(float *)2",
                      "(CALL1, 4, 0, 0)",
                      "// world.qc : think",
                      "(RETURN, 0, 0, 0)",
                      "(DONE, 0, 0, 0)"}));
}

TEST(ProgsReport, GlobalLinesShowValuesAndKeepGoingOnErrors) {
  const Progs progs = load_sample();
  const QStringList lines = progs_global_lines(progs);
  ASSERT_EQ(lines.size(), 8);
  EXPECT_EQ(lines[0].toStdString(), "float time @0 = 1");
  EXPECT_EQ(lines[1].toStdString(), "string msg @4 = \"hello\"");
  EXPECT_EQ(lines[2].toStdString(), "function main_fn @8 = main()");
  EXPECT_EQ(lines[3].toStdString(), "function bogus @12 = <Invalid func 9>");
  EXPECT_EQ(lines[4].toStdString(), "vector origin @16 = '1 2 3'");
  EXPECT_EQ(lines[5].toStdString(), "entity world @28 = entity 0");
  EXPECT_EQ(lines[6].toStdString(), "field fld @0 = <Unhandled type: field>");
  EXPECT_TRUE(lines[7].startsWith("float far @200 = <error:"));
}

TEST(ProgsReport, FieldLines) {
  const Progs progs = load_sample();
  EXPECT_EQ(progs_field_lines(progs), expected({"float .health @0", "vector .origin @1"}));
}

TEST(ProgsReport, HeaderLines) {
  ProgsHeader header;
  ProgsError error;
  const std::optional<Progs> progs = load_progs_bytes(sample_progs_builder().build(&header), &error);
  ASSERT_TRUE(progs.has_value());

  const QStringList lines = progs_header_lines(*progs);
  ASSERT_EQ(lines.size(), 2 + kProgsLumpCount);
  EXPECT_EQ(lines[0].toStdString(), "Version: 6");
  EXPECT_EQ(lines[1].toStdString(), "CRC: 5927");
  const ProgsLump& statements = header.lump(ProgsLumpId::Statements);
  EXPECT_EQ(lines[2], QString("Lump statements: offset=%1 count=5").arg(statements.offset));
}

TEST(ProgsReport, FormatsValues) {
  const Progs progs = load_sample();
  EXPECT_EQ(format_progs_value(progs, ProgsValue(QString("x"))).toStdString(), "\"x\"");
  EXPECT_EQ(format_progs_value(progs, ProgsValue(0.5f)).toStdString(), "0.5");
  EXPECT_EQ(format_progs_value(progs, ProgsValue(ProgsVec3{-1.0f, 0.0f, 2.5f})).toStdString(), "'-1 0 2.5'");
  EXPECT_EQ(format_progs_value(progs, ProgsValue(ProgsEntityRef{7})).toStdString(), "entity 7");
}

TEST(ProgsReport, FloatsKeepFullPrecision) {
  const Progs progs = load_sample();
  const float value = 0.12345678f;
  const QString text = format_progs_value(progs, ProgsValue(value));
  EXPECT_NE(text.toStdString(), "0.123457");
  EXPECT_EQ(text.toFloat(), value);

  const QString vector = format_progs_value(progs, ProgsValue(ProgsVec3{value, 1.0f, -value}));
  ASSERT_TRUE(vector.startsWith('\'') && vector.endsWith('\''));
  const QStringList parts = vector.mid(1, vector.size() - 2).split(' ');
  ASSERT_EQ(parts.size(), 3);
  EXPECT_EQ(parts[0].toFloat(), value);
  EXPECT_EQ(parts[1].toStdString(), "1");
  EXPECT_EQ(parts[2].toFloat(), -value);
}

TEST(ProgsReport, SelectedSectionsOnly) {
  const Progs progs = load_sample();
  ProgsReportOptions options;
  options.statements = false;
  options.globals = false;

  const QStringList report = build_progs_report(progs, options);
  ASSERT_EQ(report.size(), 5);
  EXPECT_EQ(report[0].toStdString(), "== Functions (4) ==");
  EXPECT_EQ(report[2].toStdString(), "print defs.qc [builtin #1]");
}

TEST(ProgsReport, SectionsAreSeparatedByABlankLine) {
  const Progs progs = load_sample();
  ProgsReportOptions options;
  options.functions = false;
  options.statements = false;
  options.fields = true;

  const QStringList report = build_progs_report(progs, options);
  ASSERT_EQ(report.size(), 1 + 8 + 1 + 1 + 2);
  EXPECT_EQ(report[0].toStdString(), "== Globals (8) ==");
  EXPECT_TRUE(report[9].isEmpty());
  EXPECT_EQ(report[10].toStdString(), "== Fields (2) ==");
}

TEST(ProgsReport, NothingSelectedIsEmpty) {
  ProgsReportOptions options;
  options.functions = false;
  options.statements = false;
  options.globals = false;
  EXPECT_FALSE(options.any());
  EXPECT_TRUE(build_progs_report(load_sample(), options).isEmpty());
}
