#pragma once

#include "report/progs_report.h"

class QSettings;

// Report sections remembered between runs. Missing keys keep the
// ProgsReportOptions defaults.
[[nodiscard]] ProgsReportOptions load_report_options(const QSettings& settings);
void save_report_options(QSettings& settings, const ProgsReportOptions& options);
