#include "cli.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include "progs/progs.h"
#include "report/report_settings.h"

namespace {
QString normalize_output(const QString& text) {
  return text.endsWith('\n') ? text : text + '\n';
}
}  // namespace

CliParseResult parse_cli(QCoreApplication& app,
                         const ProgsReportOptions& defaults,
                         CliOptions& options,
                         QString* output) {
  QCommandLineParser parser;
  parser.setApplicationDescription("Decode and disassemble a QuakeC progs.dat");
  parser.addHelpOption();
  parser.addVersionOption();

  const QCommandLineOption header_option("header", "Show the version, CRC and lump directory.");
  const QCommandLineOption functions_option({"f", "functions"}, "List functions with their source files.");
  const QCommandLineOption statements_option({"s", "statements"}, "Disassemble all statements.");
  const QCommandLineOption globals_option({"g", "globals"}, "List global definitions with their values.");
  const QCommandLineOption fields_option("fields", "List field definitions.");
  const QCommandLineOption all_option({"a", "all"}, "Show every section.");
  const QCommandLineOption save_defaults_option(
    "save-defaults",
    "Remember the chosen sections as the default for later runs.");
  const QCommandLineOption verbose_option("verbose", "Print loader diagnostics.");

  parser.addOption(header_option);
  parser.addOption(functions_option);
  parser.addOption(statements_option);
  parser.addOption(globals_option);
  parser.addOption(fields_option);
  parser.addOption(all_option);
  parser.addOption(save_defaults_option);
  parser.addOption(verbose_option);
  parser.addPositionalArgument("progs", "Path to a progs.dat file.");

  if (!parser.parse(app.arguments())) {
    if (output) {
      *output = normalize_output(parser.errorText()) + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  if (parser.isSet("help")) {
    if (output) {
      *output = parser.helpText();
    }
    return CliParseResult::ExitOk;
  }

  if (parser.isSet("version")) {
    if (output) {
      *output = normalize_output(app.applicationName() + ' ' + app.applicationVersion());
    }
    return CliParseResult::ExitOk;
  }

  const bool all = parser.isSet(all_option);
  ProgsReportOptions chosen;
  chosen.header = all || parser.isSet(header_option);
  chosen.functions = all || parser.isSet(functions_option);
  chosen.statements = all || parser.isSet(statements_option);
  chosen.globals = all || parser.isSet(globals_option);
  chosen.fields = all || parser.isSet(fields_option);

  options.sections_from_command_line = chosen.any();
  options.report = options.sections_from_command_line ? chosen : defaults;
  options.save_defaults = parser.isSet(save_defaults_option);
  options.verbose = parser.isSet(verbose_option);

  const QStringList positional = parser.positionalArguments();
  if (!positional.isEmpty()) {
    options.progs_path = positional.first();
  }

  if (options.save_defaults && !options.sections_from_command_line) {
    if (output) {
      *output = normalize_output("--save-defaults needs at least one section option.") + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  if (options.progs_path.isEmpty() && !options.save_defaults) {
    if (output) {
      *output = normalize_output("Missing progs path.") + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  return CliParseResult::Ok;
}

void apply_cli_logging(bool verbose) {
  QLoggingCategory::setFilterRules(verbose ? "default.info=true" : "default.info=false");
}

int run_cli(const CliOptions& options) {
  QTextStream out(stdout);
  QTextStream err(stderr);

  apply_cli_logging(options.verbose);

  if (options.save_defaults) {
    QSettings settings;
    save_report_options(settings, options.report);
    if (settings.status() != QSettings::NoError) {
      err << "Unable to save default sections.\n";
      return 2;
    }
    if (options.progs_path.isEmpty()) {
      out << "Default sections saved.\n";
      return 0;
    }
  }

  const QFileInfo progs_info(options.progs_path);
  if (!progs_info.exists()) {
    err << "Progs file not found: " << options.progs_path << "\n";
    return 2;
  }

  ProgsError load_err;
  const std::optional<Progs> progs = load_progs_file(progs_info.absoluteFilePath(), &load_err);
  if (!progs) {
    err << "Unable to read " << progs_info.fileName() << ": " << describe_progs_error(load_err) << "\n";
    return 2;
  }

  const QStringList lines = build_progs_report(*progs, options.report);
  for (const QString& line : lines) {
    out << line << "\n";
  }
  return 0;
}
