#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include "cli/cli.h"
#include "progscope_config.h"
#include "report/report_settings.h"

namespace {
void set_app_metadata(QCoreApplication& app) {
  app.setApplicationName("ProgScope");
  app.setOrganizationName("ProgScope");
  app.setApplicationVersion(PROGSCOPE_VERSION);
}
}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  set_app_metadata(app);

  ProgsReportOptions defaults;
  {
    const QSettings settings;
    defaults = load_report_options(settings);
  }

  CliOptions options;
  QString cli_output;
  const CliParseResult parsed = parse_cli(app, defaults, options, &cli_output);
  if (parsed != CliParseResult::Ok) {
    QTextStream stream(parsed == CliParseResult::ExitOk ? stdout : stderr);
    stream << cli_output;
    return parsed == CliParseResult::ExitOk ? 0 : 2;
  }

  return run_cli(options);
}
