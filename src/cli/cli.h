#pragma once

#include <QString>

#include "report/progs_report.h"

class QCoreApplication;

struct CliOptions {
  QString progs_path;
  ProgsReportOptions report;
  bool sections_from_command_line = false;
  bool save_defaults = false;
  bool verbose = false;
};

enum class CliParseResult {
  Ok,
  ExitOk,
  ExitError,
};

// Fills options from the command line. Sections not chosen on the command
// line come from `defaults`.
CliParseResult parse_cli(QCoreApplication& app,
                         const ProgsReportOptions& defaults,
                         CliOptions& options,
                         QString* output);
// Info messages are shown only when verbose.
void apply_cli_logging(bool verbose);
int run_cli(const CliOptions& options);
