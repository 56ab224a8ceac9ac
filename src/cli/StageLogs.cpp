/***
 * Name: pybox::cli::WriteStageLogs
 * Purpose: Write the token log and the AST log for one fragment file.
 * Theory of Operation:
 *   Files are named <timestamp>-lexer.lex.log and <timestamp>-ast.ast.log
 *   under the log directory, which is created when missing. A source that
 *   does not parse gets no AST log; the validator reports the error.
 */
#include "cli/App.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

#include "ast/AstPrinter.h"
#include "ast/GeometrySummary.h"
#include "lexer/Lexer.h"
#include "observability/Log.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"
#include "pybox/exceptions/config_error.h"
#include "pybox/exceptions/parse_error.h"

namespace pybox::cli {

namespace {

std::string timestampPrefix() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tmBuf{};
  localtime_r(&now, &tmBuf);
  std::ostringstream oss;
  oss << std::put_time(&tmBuf, "%Y%m%d-%H%M%S") << "-";
  return oss.str();
}

std::ofstream openLog(const std::string& file) {
  std::ofstream out(file);
  if (!out) { throw exceptions::ConfigError("cannot write log file '" + file + "'"); }
  return out;
}

} // namespace

void WriteStageLogs(const Options& opts, const std::string& path, const std::string& source) {
  if (!opts.logLexer && !opts.logAst) { return; }

  namespace fs = std::filesystem;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  std::error_code errCode;
  if (!fs::exists(logDir, errCode) && !fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
    throw exceptions::ConfigError("failed to create log directory '" + logDir + "': " + errCode.message());
  }
  const std::string prefix = logDir + "/" + timestampPrefix();

  if (opts.logLexer) {
    lex::Lexer lexer;
    {
      metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Lex);
      lexer.pushString(source, path);
    }
    std::ofstream lexFile = openLog(prefix + "lexer.lex.log");
    for (const auto& tok : lexer.tokens()) {
      lexFile << tok.file << ":" << tok.line << ":" << tok.col << " " << lex::to_string(tok.kind) << " " << tok.text
              << "\n";
    }
    log::Log::Debug("wrote " + prefix + "lexer.lex.log");
  }

  if (opts.logAst) {
    std::unique_ptr<ast::Module> mod;
    try {
      metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Parse);
      lex::Lexer lexer;
      lexer.pushString(source, path);
      parse::Parser parser(lexer);
      mod = parser.parseModule();
    } catch (const exceptions::ParseError& e) {
      log::Log::Warning(std::string("no AST log: ") + e.what());
      return;
    }
    metrics::Metrics::SetASTGeometry(ast::computeGeometry(*mod));
    std::ofstream astFile = openLog(prefix + "ast.ast.log");
    astFile << ast::dump(*mod);
    log::Log::Debug("wrote " + prefix + "ast.ast.log");
  }
}

} // namespace pybox::cli
