#include "cli.hpp"
#include "matcher.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace grep {

static bool debug_enabled()
{
    const char* value = std::getenv("GREP_DEBUG");
    return value != nullptr && std::string(value) == "1";
}

Arguments parse_arguments(const std::vector<std::string>& args)
{
    Arguments parsed;
    bool extended = false;
    bool have_pattern = false;

    for(size_t i = 1; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if(arg == "-E") extended = true;
        else if(arg == "-r") parsed.recursive = true;
        else if(!have_pattern) { parsed.pattern = arg; have_pattern = true; }
        else parsed.paths.push_back(arg);
    }

    if(!extended) throw std::runtime_error("Expected '-E' flag");
    if(!have_pattern) throw std::runtime_error("Expected a pattern argument");
    return parsed;
}

std::vector<std::string> collect_files(const std::vector<std::string>& paths, bool recursive)
{
    std::vector<std::string> files;
    for(const auto& path : paths)
    {
        std::error_code ec;
        if(fs::is_directory(path, ec))
        {
            if(!recursive) throw std::runtime_error(path + ": Is a directory");

            std::vector<std::string> found;
            fs::recursive_directory_iterator it(path, ec), end;
            if(ec) throw std::runtime_error("Could not read directory: " + path);
            for(; it != end; it.increment(ec))
            {
                if(ec) throw std::runtime_error("Could not read directory: " + path);
                if(it->is_regular_file(ec)) found.push_back(it->path().string());
            }
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        }
        else if(fs::exists(path, ec))
        {
            files.push_back(path);
        }
        else
        {
            throw std::runtime_error("Could not open file: " + path);
        }
    }
    return files;
}

static bool search_stream(const CompiledPattern& pattern, std::istream& input, const std::string& prefix, std::ostream& out)
{
    bool found_match = false;
    std::string line;
    while(std::getline(input, line))
    {
        if(pattern.test(line))
        {
            out << prefix << line << '\n';
            found_match = true;
        }
    }
    return found_match;
}

int search(const Arguments& args, std::istream& in, std::ostream& out, std::ostream& err)
{
    CompiledPattern pattern = CompiledPattern::compile(args.pattern);
    bool debug = debug_enabled();
    if(debug) err << "[debug] pattern " << describe(pattern.ast()) << '\n';

    std::vector<std::string> paths = args.paths;
    if(paths.empty() && args.recursive) paths.push_back(".");

    if(paths.empty())
    {
        // Stdin input mode
        return search_stream(pattern, in, "", out) ? 0 : 1;
    }

    std::vector<std::string> files = collect_files(paths, args.recursive);
    bool with_prefix = args.recursive || files.size() > 1;
    bool found_match = false;

    for(const auto& filename : files)
    {
        if(debug) err << "[debug] searching " << filename << '\n';
        std::ifstream file(filename);
        if(!file.is_open()) throw std::runtime_error("Could not open file: " + filename);

        std::string prefix = with_prefix ? filename + ":" : "";
        if(search_stream(pattern, file, prefix, out)) found_match = true;
        if(file.bad()) throw std::runtime_error("Could not read file: " + filename);
    }
    return found_match ? 0 : 1;
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err)
{
    try {
        Arguments parsed = parse_arguments(args);
        return search(parsed, in, out, err);
    } catch (const std::runtime_error& e) {
        err << e.what() << std::endl;
        return 1;
    }
}

}
