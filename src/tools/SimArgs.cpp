#include "tools/SimArgs.h"

#include <cctype>
#include <limits>
#include <string_view>

namespace skirmish::tools {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value" form.
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() <= n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<std::uint64_t> ParseUnsigned(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    std::uint64_t v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10U)
            return std::nullopt;
        v = v * 10U + digit;
    }
    return v;
}

[[nodiscard]] std::optional<int> ParsePositiveInt(std::string_view s)
{
    const auto v = ParseUnsigned(s);
    if (!v || *v == 0 || *v > 1'000'000'000ULL)
        return std::nullopt;
    return static_cast<int>(*v);
}

} // namespace

SimArgs ParseSimArgs(const std::vector<std::string>& args)
{
    SimArgs out;

    // Options that take a value, in either "--opt=value" or "--opt value" form.
    enum class Opt { None, Config, Roster, Mode, Seed, Duration, Tick, LogLevel, LogFile };

    const auto optFor = [](std::string_view name) -> Opt {
        if (name == "--config")    return Opt::Config;
        if (name == "--roster")    return Opt::Roster;
        if (name == "--mode")      return Opt::Mode;
        if (name == "--seed")      return Opt::Seed;
        if (name == "--duration")  return Opt::Duration;
        if (name == "--tick")      return Opt::Tick;
        if (name == "--log-level") return Opt::LogLevel;
        if (name == "--log-file")  return Opt::LogFile;
        return Opt::None;
    };

    const auto apply = [&](Opt opt, const std::string& raw, std::string_view value) {
        switch (opt)
        {
            case Opt::Config:   out.configPath = std::string(value); break;
            case Opt::Roster:   out.rosterPath = std::string(value); break;
            case Opt::Mode:     out.mode = ToLower(value); break;
            case Opt::LogLevel: out.logLevel = ToLower(value); break;
            case Opt::LogFile:  out.logFile = std::string(value); break;
            case Opt::Seed:
                if (const auto v = ParseUnsigned(value)) out.seed = *v;
                else out.unknown.push_back(raw);
                break;
            case Opt::Duration:
                if (const auto v = ParsePositiveInt(value)) out.durationMs = *v;
                else out.unknown.push_back(raw);
                break;
            case Opt::Tick:
                if (const auto v = ParsePositiveInt(value)) out.tickMs = *v;
                else out.unknown.push_back(raw);
                break;
            case Opt::None:
                out.unknown.push_back(raw);
                break;
        }
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& raw = args[i];
        if (raw.empty())
            continue;

        const std::string arg = ToLower(raw);
        if (arg == "--help" || arg == "-h" || arg == "-?")
        {
            out.showHelp = true;
            continue;
        }

        // --opt=value (value keeps its original case)
        const std::size_t eq = arg.find('=');
        if (eq != std::string::npos)
        {
            const Opt opt = optFor(std::string_view(arg).substr(0, eq));
            std::string_view value;
            if (opt != Opt::None && ConsumeValue(raw, std::string_view(raw).substr(0, eq), value))
                apply(opt, raw, value);
            else
                out.unknown.push_back(raw);
            continue;
        }

        // --opt value
        const Opt opt = optFor(arg);
        if (opt == Opt::None || i + 1 >= args.size())
        {
            out.unknown.push_back(raw);
            continue;
        }
        apply(opt, raw, args[++i]);
    }

    return out;
}

SimArgs ParseSimArgs(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i] ? argv[i] : "");
    return ParseSimArgs(args);
}

std::string BuildSimHelpText()
{
    return
        "skirmish_sim - headless scripted encounter\n"
        "\n"
        "Usage: skirmish_sim [options]\n"
        "\n"
        "  --config <file>       Encounter tuning (JSON). Defaults when omitted.\n"
        "  --roster <file>       Party/opponent roster (JSON). Built-in demo roster when omitted.\n"
        "  --mode <m>            realtime | turn_based (overrides the config)\n"
        "  --seed <n>            RNG seed (overrides the config)\n"
        "  --duration <ms>       Simulated time cap (default 60000)\n"
        "  --tick <ms>           Fixed frame step (default 16)\n"
        "  --log-level <lvl>     trace | debug | info | warn | error | off\n"
        "  --log-file <path>     Also log to a rotating file\n"
        "  -h, --help            Show this text\n";
}

} // namespace skirmish::tools
