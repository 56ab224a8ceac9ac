#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pybox::cli {

namespace {
constexpr std::string_view kUsageText = R"(pybox [options] file

Validate a fragment and run it against a dry-run game handle.

Options:
  -h, --help            Print this help and exit
  --validate-only       Validate only; never execute the fragment
  --mode=<mode>         Fragment mode: named|adhoc (default: adhoc)
  --entry=<name>        Entry function expected in named mode
  --timeout=<seconds>   Execution timeout (default: $PYBOX_TIMEOUT or 30)
  --param=<key>=<value> Keyword argument for the entry function (repeatable)
  --seed=<n>            Seed for the fragment's random module
  --json                Print the result as JSON
  --metrics             Print metrics summary
  --metrics-json        Print metrics in JSON
  --verbose             Log sandbox events to stderr
  --log-path=<dir>      Directory where logs are written (lexer/ast)
  --log-lexer           Write the token log (see --log-path)
  --log-ast             Write the AST log (see --log-path)
  --                    End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pybox::cli
