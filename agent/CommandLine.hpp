#pragma once

#include <optional>
#include <string>
#include <vector>

namespace netsweep::agent
{
    struct CommandLine
    {
        std::string config_path;
        bool once = false;
        bool verbose = false;
        bool remember = false;
        bool help = false;
        std::optional<std::string> single_ip;
    };

    // argv[0] excluded. Returns an error message for unknown flags or missing values.
    std::optional<std::string> ParseCommandLine(const std::vector<std::string> &args, CommandLine &out);

    std::string Usage(const std::string &program);
}
