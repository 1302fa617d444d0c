#include "CommandLine.hpp"

namespace netsweep::agent
{
    std::optional<std::string> ParseCommandLine(const std::vector<std::string> &args, CommandLine &out)
    {
        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];

            if (arg == "--config" || arg == "--ip")
            {
                if (i + 1 >= args.size() || args[i + 1].rfind("--", 0) == 0)
                    return arg + " needs a value";

                if (arg == "--config")
                    out.config_path = args[++i];
                else
                    out.single_ip = args[++i];
            }
            else if (arg == "--once")
                out.once = true;
            else if (arg == "--verbose" || arg == "-v")
                out.verbose = true;
            else if (arg == "--remember")
                out.remember = true;
            else if (arg == "--help" || arg == "-h")
                out.help = true;
            else
                return "unknown argument '" + arg + "'";
        }

        if (out.remember && !out.single_ip)
            return "--remember only applies together with --ip";
        if (out.once && out.single_ip)
            return "--once and --ip are mutually exclusive";
        return std::nullopt;
    }

    std::string Usage(const std::string &program)
    {
        return "Usage: " + program + " [--config <file>] [--once | --ip <address> [--remember]] [--verbose]\n"
                                     "  --config <file>  YAML configuration (defaults apply when omitted)\n"
                                     "  --once           run one sweep, print the roster and exit\n"
                                     "  --ip <address>   probe a single host without touching the roster\n"
                                     "  --remember       add the host probed with --ip to the known devices\n"
                                     "  --verbose        debug logging\n";
    }
}
