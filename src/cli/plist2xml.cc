#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "plistio.hpp"

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace {

struct CommandLine {
  bool in_place = false;
  bool quiet = false;
  libplistio::XmlWriterOptions xml;
  std::string input = "-";
  std::string output = "-";
};

void print_usage() {
  std::cerr
      << "usage: plist2xml [-iq] [-s N] input [output]\n\n"
      << "Re-encodes a binary or XML property list as XML.\n\n"
      << "  -i, --in-place   Replace input with the converted file\n"
      << "  -q, --quiet      Suppress warnings about the input\n"
      << "  -s, --spaces N   Indent N spaces per level (default: one tab)\n"
      << "  -h, --help       Print this text\n\n"
      << "Short flags may be combined, e.g. -iq. A path of '-' stands for "
         "stdin or stdout.\n";
}

bool parse_spaces(const char *text, std::string &indent) {
  char *end = nullptr;
  long count = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || count < 0 || count > 16) {
    return false;
  }
  indent.assign(static_cast<size_t>(count), ' ');
  return true;
}

// Applies one short flag letter. Returns false for letters it doesn't know.
bool apply_short_flag(char letter, CommandLine &cmd) {
  switch (letter) {
  case 'i':
    cmd.in_place = true;
    return true;
  case 'q':
    cmd.quiet = true;
    return true;
  default:
    return false;
  }
}

// Returns -1 to continue, otherwise the exit status.
int parse_command_line(int argc, char *argv[], CommandLine &cmd) {
  int pos = 1;
  while (pos < argc) {
    std::string arg = argv[pos];
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    if (arg == "--in-place") {
      cmd.in_place = true;
    } else if (arg == "--quiet") {
      cmd.quiet = true;
    } else if (arg == "-s" || arg == "--spaces") {
      if (pos + 1 == argc || !parse_spaces(argv[pos + 1], cmd.xml.indent)) {
        std::cerr << "Error: " << arg << " expects a number from 0 to 16\n";
        return 1;
      }
      ++pos;
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
      for (size_t i = 1; i < arg.size(); ++i) {
        if (!apply_short_flag(arg[i], cmd)) {
          std::cerr << "Error: Unknown option -" << arg[i] << "\n";
          return 1;
        }
      }
    } else {
      break;
    }
    ++pos;
  }

  if (pos == argc && isatty(fileno(stdin))) {
    std::cerr << "Error: No input given\n\n";
    print_usage();
    return 1;
  }
  if (pos < argc) {
    cmd.input = argv[pos++];
  }
  if (pos < argc) {
    cmd.output = argv[pos++];
  }
  if (pos < argc) {
    std::cerr << "Error: Unexpected argument '" << argv[pos] << "'\n";
    return 1;
  }

  if (cmd.in_place) {
    if (cmd.input == "-") {
      std::cerr << "Error: -i/--in-place needs an input file\n";
      return 1;
    }
    if (cmd.output != "-") {
      std::cerr << "Error: -i/--in-place already writes to the input file\n";
      return 1;
    }
    cmd.output = cmd.input;
  }
  return -1;
}

std::unique_ptr<std::istream> open_input(const std::string &path) {
  if (path == "-") {
    // Detection seeks back to the start, which a pipe can't do.
    auto buffered = std::make_unique<std::stringstream>(
        std::ios::in | std::ios::out | std::ios::binary);
    *buffered << std::cin.rdbuf();
    // An empty stdin leaves failbit set on the copy.
    buffered->clear();
    return buffered;
  }
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*file) {
    throw libplistio::Error(libplistio::ErrorKind::Io, "Cannot read " + path);
  }
  return file;
}

void store_output(const std::string &path, const std::string &text) {
  if (path == "-") {
    std::cout << text;
    std::cout.flush();
    return;
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << text;
  file.close();
  if (!file) {
    throw libplistio::Error(libplistio::ErrorKind::Io, "Cannot write " + path);
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  int status = parse_command_line(argc, argv, cmd);
  if (status >= 0) {
    return status;
  }

  libplistio::ReaderOptions reader_options;
  if (!cmd.quiet) {
    reader_options.warning_callback = [](const std::string &category,
                                         const std::string &message) {
      std::cerr << "Warning [" << category << "]: " << message << "\n";
    };
  }

  try {
    std::ostringstream converted;
    libplistio::convertToXml(open_input(cmd.input), converted, reader_options,
                             cmd.xml);
    store_output(cmd.output, converted.str());
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
