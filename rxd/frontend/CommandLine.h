#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "rxd/dump/DumpOptions.h"
#include "rxd/utility/Exceptions.h"

namespace rxd::frontend {

//! \brief The command line could not be understood, e.g. an unknown flag or a malformed number.
class CommandLineError : public RxdError {
public:
  using RxdError::RxdError;
};

//! \brief Everything the rxd application needs from its command line.
struct CommandLineArgs {
  //! \brief The file to dump. "-" means standard input.
  std::filesystem::path file_path;

  //! \brief The dump options, already validated.
  DumpOptions options;

  //! \brief Whether to send diagnostic logging to stdout.
  bool verbose = false;

  //! \brief Print the usage and exit.
  bool show_help = false;

  //! \brief Print the version and exit.
  bool show_version = false;
};

//! \brief Parse the command line of the rxd application.
//!
//! Throws CommandLineError for unknown flags, missing values, malformed numbers, or a missing or extra file
//! argument, and InvalidConfiguration for a width or group length out of range. When help or version is
//! requested, the file argument may be omitted.
NO_DISCARD CommandLineArgs ParseCommandLine(int argc, const char* const* argv);

//! \brief The usage text for the rxd application.
NO_DISCARD std::string Usage(std::string_view program_name);

}  // namespace rxd::frontend
