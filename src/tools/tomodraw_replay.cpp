#include "core/draw_engine.h"
#include "core/grid_model.h"
#include "io/event_script.h"
#include "io/settings.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " --script <events.json> [--settings <settings.json>] [--quiet]\n"
              << "\n"
              << "Replays a recorded pointer/tool/text event script against a blank 80x24 grid\n"
              << "and prints the resulting drawing as plain text.\n"
              << "\n"
              << "Options:\n"
              << "  --script <file>    Event script (required)\n"
              << "  --settings <file>  Settings file (default: <config_dir>/settings.json if present)\n"
              << "  --quiet            Do not report rejected events\n";
}
} // namespace

int main(int argc, char** argv)
{
    std::string script_path;
    std::string settings_path;
    bool quiet = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--script")
        {
            script_path = std::string(need("--script"));
        }
        else if (a == "--settings")
        {
            settings_path = std::string(need("--settings"));
        }
        else if (a == "--quiet")
        {
            quiet = true;
        }
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (script_path.empty())
    {
        PrintUsage(argv[0]);
        return 2;
    }

    tomo::Settings settings;
    std::string err;
    const bool settings_ok = settings_path.empty()
        ? tomo::LoadSettings(settings, err)
        : tomo::LoadSettingsFromFile(settings_path, settings, err);
    if (!settings_ok)
    {
        std::fprintf(stderr, "[settings] %s\n", err.c_str());
        return 1;
    }

    tomo::EventScript script;
    if (!tomo::LoadEventScriptFromFile(script_path, script, err))
    {
        std::fprintf(stderr, "[replay] %s\n", err.c_str());
        return 1;
    }

    tomo::GridModel grid;
    tomo::DrawEngine engine(grid);
    tomo::ApplySettings(settings, engine);

    for (size_t i = 0; i < script.events.size(); ++i)
    {
        const tomo::DrawResult r = tomo::ApplyScriptEvent(script.events[i], engine);
        if (r != tomo::DrawResult::Ok && !quiet)
        {
            const std::string_view what = tomo::ToString(r);
            std::fprintf(stderr, "[replay] event %zu: %.*s\n", i, (int)what.size(), what.data());
        }
    }

    std::cout << engine.ExportText() << "\n";
    return 0;
}
