#include "App/Options.hpp"

#include <cctype>
#include <limits>

int32_t ParseInt32(const std::string& text, const std::string& what)
{
    size_t pos = 0;
    long long v = 0;
    try
    {
        v = std::stoll(text, &pos, 10);
    }
    catch (const std::invalid_argument&)
    {
        throw std::invalid_argument(what + " must be an integer, got '" + text + "'");
    }
    catch (const std::out_of_range&)
    {
        throw std::invalid_argument(what + " is out of range: '" + text + "'");
    }

    // reject trailing junk like "12abc"
    while (pos < text.size() && std::isspace((unsigned char)text[pos])) ++pos;
    if (pos != text.size())
        throw std::invalid_argument(what + " must be an integer, got '" + text + "'");

    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())
        throw std::invalid_argument(what + " is out of range: '" + text + "'");

    return static_cast<int32_t>(v);
}

Cell ParseCell(const std::string& text, const std::string& what)
{
    const size_t comma = text.find(',');
    if (comma == std::string::npos)
        throw std::invalid_argument(what + " must look like X,Y, got '" + text + "'");

    return { ParseInt32(text.substr(0, comma), what + " x"),
             ParseInt32(text.substr(comma + 1), what + " y") };
}

void AppOptions::Validate() const
{
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("--width and --height must be positive");

    auto check = [&](const Cell& c, const char* name) {
        if (c.x < 0 || c.y < 0 || c.x >= width || c.y >= height)
            throw std::invalid_argument(std::string(name) + " " + ToString(c) + " is outside the "
                                        + std::to_string(width) + "x" + std::to_string(height) + " maze");
    };

    check(StartOrDefault(), "--start");
    check(EndOrDefault(), "--end");
}

AppOptions ParseOptions(int argc, const char* const* argv, const AppOptions& defaults)
{
    AppOptions opt = defaults;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string value;
        bool hasValue = false;

        // --flag=value
        const size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos)
        {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            hasValue = true;
        }

        auto takeValue = [&]() -> std::string {
            if (hasValue) return value;
            if (i + 1 >= argc)
                throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        auto noValue = [&]() {
            if (hasValue)
                throw std::invalid_argument(arg + " does not take a value");
        };

        if (arg == "--width")
        {
            opt.width = ParseInt32(takeValue(), "--width");
        }
        else if (arg == "--height")
        {
            opt.height = ParseInt32(takeValue(), "--height");
        }
        else if (arg == "--seed")
        {
            opt.seed = ParseInt32(takeValue(), "--seed");
        }
        else if (arg == "--start")
        {
            opt.start = ParseCell(takeValue(), "--start");
        }
        else if (arg == "--end")
        {
            opt.end = ParseCell(takeValue(), "--end");
        }
        else if (arg == "--show-explored")
        {
            noValue();
            opt.showExplored = true;
        }
        else if (arg == "--trace")
        {
            noValue();
            opt.trace = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opt.help = true;
        }
        else
        {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    return opt;
}

std::string Usage(const std::string& program, const AppOptions& defaults)
{
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --width N          maze width (default: " << defaults.width << ")\n"
        << "  --height N         maze height (default: " << defaults.height << ")\n"
        << "  --seed N           seed for maze generation (default: random)\n"
        << "  --start X,Y        start cell (default: 0,0)\n"
        << "  --end X,Y          end cell (default: bottom-right corner)\n"
        << "  --show-explored    mark cells explored by the search\n"
        << "  --trace            print the exploration order\n"
        << "  -h, --help         show this message\n";
    return oss.str();
}
