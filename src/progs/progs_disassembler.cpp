#include "progs/progs_disassembler.h"

#include "progs/progs_types.h"

QString format_progs_statement_raw(const ProgsStatement& statement) {
  return QString("(%1, %2, %3, %4)")
    .arg(progs_op_name(statement.op))
    .arg(statement.a)
    .arg(statement.b)
    .arg(statement.c);
}

QString format_progs_statement(const ProgsStatement& statement) {
  const ProgsBinaryOp* binary = find_progs_binary_op(statement.op);
  if (!binary) {
    return format_progs_statement_raw(statement);
  }
  return QString("*(%1 *)%2 = *(%3 *)%4 %5 *(%6 *)%7")
    .arg(progs_type_name(binary->result))
    .arg(statement.c)
    .arg(progs_type_name(binary->left))
    .arg(statement.a)
    .arg(QString::fromLatin1(binary->symbol))
    .arg(progs_type_name(binary->right))
    .arg(statement.b);
}
