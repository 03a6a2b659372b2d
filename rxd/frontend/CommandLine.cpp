#include "rxd/frontend/CommandLine.h"
// Other files.
#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <vector>

namespace rxd::frontend {

namespace {

std::size_t parseCount(std::string_view flag, std::string_view value) {
  std::size_t result = 0;
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, result);
  if (value.empty() || ec != std::errc {} || ptr != end) {
    RXD_THROW(CommandLineError, "invalid value '" << value << "' for " << flag << ", expected a non-negative integer");
  }
  return result;
}

//! \brief Walks the arguments, handing out flag values as they are requested.
class ArgumentCursor {
public:
  ArgumentCursor(int argc, const char* const* argv)
      : arguments_(argv + 1, argv + std::max(argc, 1)) {}

  NO_DISCARD bool Done() const noexcept { return index_ == arguments_.size(); }

  std::string_view Next() { return arguments_[index_++]; }

  //! \brief Get the value of a flag, either attached ("-w8", "--width=8") or as the next argument.
  std::string_view Value(std::string_view flag, std::optional<std::string_view> attached) {
    if (attached) {
      return *attached;
    }
    if (Done()) {
      RXD_THROW(CommandLineError, "missing value for " << flag);
    }
    return Next();
  }

private:
  std::vector<std::string_view> arguments_;
  std::size_t index_ = 0;
};

//! \brief Set a switch (an option without a value). Returns false if the flag is not a switch.
bool applySwitch(CommandLineArgs& args, std::string_view flag) {
  if (flag == "-h" || flag == "--help") {
    args.show_help = true;
  }
  else if (flag == "-V" || flag == "--version") {
    args.show_version = true;
  }
  else if (flag == "-v" || flag == "--verbose") {
    args.verbose = true;
  }
  else if (flag == "-c" || flag == "--control-pictures") {
    args.options.SetControlPictures(true);
  }
  else {
    return false;
  }
  return true;
}

//! \brief Set an option that takes a count. Returns false, without consuming anything, if the flag is not one.
bool applyValue(CommandLineArgs& args,
                std::string_view flag,
                std::optional<std::string_view> attached,
                ArgumentCursor& cursor) {
  if (flag == "-l" || flag == "--lines") {
    args.options.SetLineCount(parseCount(flag, cursor.Value(flag, attached)));
  }
  else if (flag == "-w" || flag == "--width") {
    args.options.SetLineWidth(parseCount(flag, cursor.Value(flag, attached)));
  }
  else if (flag == "-g" || flag == "--group") {
    args.options.SetByteGroupLength(parseCount(flag, cursor.Value(flag, attached)));
  }
  else {
    return false;
  }
  return true;
}

}  // namespace

CommandLineArgs ParseCommandLine(int argc, const char* const* argv) {
  CommandLineArgs args;
  std::vector<std::string_view> positional;

  ArgumentCursor cursor(argc, argv);
  bool only_positional = false;
  while (!cursor.Done()) {
    auto argument = cursor.Next();

    // A lone "-" is the standard input, and everything after "--" is a file name.
    if (only_positional || argument == "-" || !argument.starts_with('-')) {
      positional.push_back(argument);
      continue;
    }
    if (argument == "--") {
      only_positional = true;
      continue;
    }

    if (argument.starts_with("--")) {
      // Long options take their value either after an '=' or as the next argument.
      std::string_view flag = argument;
      std::optional<std::string_view> attached;
      if (auto eq = argument.find('='); eq != std::string_view::npos) {
        flag = argument.substr(0, eq);
        attached = argument.substr(eq + 1);
      }
      if (applySwitch(args, flag)) {
        if (attached) {
          RXD_THROW(CommandLineError, "option " << flag << " does not take a value");
        }
      }
      else if (!applyValue(args, flag, attached, cursor)) {
        RXD_THROW(CommandLineError, "unknown option '" << argument << "'");
      }
      continue;
    }

    // Short options may be clustered: "-cv" is "-c -v", and "-cw8" is "-c -w 8".
    for (std::size_t i = 1; i < argument.size(); ++i) {
      const std::string flag {'-', argument[i]};
      if (applySwitch(args, flag)) {
        continue;
      }
      std::optional<std::string_view> attached;
      if (i + 1 < argument.size()) {
        attached = argument.substr(i + 1);
      }
      if (!applyValue(args, flag, attached, cursor)) {
        RXD_THROW(CommandLineError, "unknown option '" << flag << "' in '" << argument << "'");
      }
      // The rest of the cluster, if any, was the value.
      break;
    }
  }

  if (args.show_help || args.show_version) {
    return args;
  }
  if (positional.empty()) {
    RXD_THROW(CommandLineError, "missing file path");
  }
  if (1 < positional.size()) {
    RXD_THROW(CommandLineError, "expected one file path, got " << positional.size());
  }
  args.file_path = std::filesystem::path(positional.front());
  return args;
}

std::string Usage(std::string_view program_name) {
  std::string usage = "Usage: ";
  usage.append(program_name);
  usage.append(" [options] <file-path>\n"
               "\n"
               "Options:\n"
               "  -l, --lines <n>           number of lines to print\n"
               "  -w, --width <n>           number of bytes per line (1-256, default 16)\n"
               "  -g, --group <n>           number of bytes per group (1-256, default 1)\n"
               "  -c, --control-pictures    display C0 control codes as characters\n"
               "  -v, --verbose             log diagnostics\n"
               "  -h, --help                print this message\n"
               "  -V, --version             print the version\n"
               "\n"
               "Use - as the file path to read standard input.\n");
  return usage;
}

}  // namespace rxd::frontend
