#include <iostream>

#include "rxd/dump/Dumper.h"
#include "rxd/frontend/CommandLine.h"

#ifndef RXD_VERSION
#define RXD_VERSION "unknown"
#endif

//! \brief Hex dump a file, or standard input, to standard output.
//!
//! Exit codes: 0 on success, 1 if the input could not be opened or read, 2 for a bad command line.
int main(int argc, char** argv) {
  using namespace rxd;

  const char* program_name = 0 < argc ? argv[0] : "rxd";

  frontend::CommandLineArgs args;
  try {
    args = frontend::ParseCommandLine(argc, argv);
  }
  catch (const RxdError& ex) {
    std::cerr << "error: " << ex.what() << "\n\n" << frontend::Usage(program_name);
    return 2;
  }

  if (args.show_help) {
    std::cout << frontend::Usage(program_name);
    return 0;
  }
  if (args.show_version) {
    std::cout << "rxd " << RXD_VERSION << std::endl;
    return 0;
  }
  if (args.verbose) {
    // Diagnostics go to stderr, stdout only ever holds the dump.
    lightning::Global::GetCore()->AddSink(lightning::NewSink<lightning::OstreamSink>(std::cerr));
  }

  try {
    if (args.file_path == "-") {
      HexDump(std::cin, std::cout, args.options);
    }
    else {
      HexDump(args.file_path, std::cout, args.options);
    }
  }
  catch (const RxdError& ex) {
    // Whatever was already dumped stays on stdout.
    std::cout << std::flush;
    LOG_SEV(Error) << "Dump failed:" << ex;
    std::cerr << "error: " << ex.what() << std::endl;
    return 1;
  }

  return 0;
}
