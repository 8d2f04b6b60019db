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
    std::string input = "-";
    std::string output = "-";
};

void print_usage() {
    std::cerr << "usage: plist2bin [-i] [-q] input [output]\n\n"
              << "Re-encodes an XML or binary property list as a binary (bplist00) one.\n\n"
              << "  -i, --in-place  Replace input with the converted file\n"
              << "  -q, --quiet     Suppress warnings about the input\n"
              << "  -h, --help      Print this text\n\n"
              << "A path of '-' stands for stdin or stdout. Without arguments, a piped\n"
              << "stdin is converted to stdout.\n";
}

// Returns -1 to continue, otherwise the exit status.
int parse_command_line(int argc, char* argv[], CommandLine& cmd) {
    int pos = 1;
    for (; pos < argc; ++pos) {
        std::string flag = argv[pos];
        if (flag == "-i" || flag == "--in-place") {
            cmd.in_place = true;
        } else if (flag == "-q" || flag == "--quiet") {
            cmd.quiet = true;
        } else if (flag == "-h" || flag == "--help") {
            print_usage();
            return 0;
        } else {
            break;
        }
    }

    if (pos == argc) {
        if (isatty(fileno(stdin))) {
            std::cerr << "Error: No input given\n\n";
            print_usage();
            return 1;
        }
        if (cmd.in_place) {
            std::cerr << "Error: -i needs an input file\n";
            return 1;
        }
        return -1;
    }

    cmd.input = argv[pos++];
    if (pos < argc) {
        cmd.output = argv[pos++];
    }
    if (pos < argc) {
        std::cerr << "Error: Unexpected argument '" << argv[pos] << "'\n";
        return 1;
    }

    if (cmd.in_place) {
        if (cmd.input == "-") {
            std::cerr << "Error: -i cannot rewrite stdin\n";
            return 1;
        }
        if (cmd.output != "-") {
            std::cerr << "Error: -i already writes to the input file\n";
            return 1;
        }
        cmd.output = cmd.input;
    }
    return -1;
}

std::unique_ptr<std::istream> open_input(const std::string& path) {
    if (path != "-") {
        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*file) {
            throw libplistio::Error(libplistio::ErrorKind::Io, "Cannot read " + path);
        }
        return file;
    }

    // Detection seeks back to the start, so stdin is read into memory first.
    auto buffered = std::make_unique<std::stringstream>(
        std::ios::in | std::ios::out | std::ios::binary);
    *buffered << std::cin.rdbuf();
    // An empty stdin leaves failbit set on the copy.
    buffered->clear();
    return buffered;
}

void store_output(const std::string& path, const std::string& bytes) {
    if (path == "-") {
        std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        std::cout.flush();
        return;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        throw libplistio::Error(libplistio::ErrorKind::Io, "Cannot write " + path);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    int status = parse_command_line(argc, argv, cmd);
    if (status >= 0) {
        return status;
    }

    libplistio::ReaderOptions options;
    if (!cmd.quiet) {
        options.warning_callback = [](const std::string& category, const std::string& message) {
            std::cerr << "Warning [" << category << "]: " << message << "\n";
        };
    }

    try {
        // The whole file is converted before the output is opened, so -i
        // leaves the input untouched when conversion fails.
        std::ostringstream converted(std::ios::out | std::ios::binary);
        libplistio::convertToBinary(open_input(cmd.input), converted, options);
        store_output(cmd.output, converted.str());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
