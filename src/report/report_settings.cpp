#include "report/report_settings.h"

#include <QSettings>

namespace {
constexpr char kHeaderKey[] = "report/header";
constexpr char kFunctionsKey[] = "report/functions";
constexpr char kStatementsKey[] = "report/statements";
constexpr char kGlobalsKey[] = "report/globals";
constexpr char kFieldsKey[] = "report/fields";
}  // namespace

ProgsReportOptions load_report_options(const QSettings& settings) {
  const ProgsReportOptions defaults;
  ProgsReportOptions out;
  out.header = settings.value(kHeaderKey, defaults.header).toBool();
  out.functions = settings.value(kFunctionsKey, defaults.functions).toBool();
  out.statements = settings.value(kStatementsKey, defaults.statements).toBool();
  out.globals = settings.value(kGlobalsKey, defaults.globals).toBool();
  out.fields = settings.value(kFieldsKey, defaults.fields).toBool();
  return out;
}

void save_report_options(QSettings& settings, const ProgsReportOptions& options) {
  settings.setValue(kHeaderKey, options.header);
  settings.setValue(kFunctionsKey, options.functions);
  settings.setValue(kStatementsKey, options.statements);
  settings.setValue(kGlobalsKey, options.globals);
  settings.setValue(kFieldsKey, options.fields);
  settings.sync();
}
