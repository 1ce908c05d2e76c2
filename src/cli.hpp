#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace grep {

struct Arguments {
    bool recursive = false;
    std::string pattern;
    std::vector<std::string> paths;
};

// Throws std::runtime_error when -E or the pattern is missing.
Arguments parse_arguments(const std::vector<std::string>& args);

// Regular files to search, in order. Directories are walked (sorted) only
// when recursive is set. Throws std::runtime_error for a missing path or a
// directory without -r.
std::vector<std::string> collect_files(const std::vector<std::string>& paths, bool recursive);

// Searches stdin or the given paths and writes matching lines to out.
// Returns 0 if any line matched, 1 otherwise. Throws std::runtime_error
// when a file cannot be read.
int search(const Arguments& args, std::istream& in, std::ostream& out, std::ostream& err);

// Full command line handling; errors are reported on err and give status 1.
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

}
