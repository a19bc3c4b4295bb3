#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "driver/Transpiler.h"
#include "unihir/exceptions/unihir_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: unihir::main
 * Purpose: CLI entry point for the unihir transpiler.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke Transpiler::run.
 */
int main(const int argc, char** argv) {
  try {
    unihir::cli::Options opts;
    if (!unihir::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "unihir: argument parse error\n";
      std::cerr << unihir::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << unihir::cli::Usage();
      return 0;
    }
    return unihir::driver::Transpiler::run(opts);
  } catch (const unihir::exceptions::UnihirException& ex) {
    std::cerr << "unihir: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "unihir: unhandled exception: " << ex.what() << "\n";
    return 1;
  }
}
