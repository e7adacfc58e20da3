#include "MatchaUtil/Logging.h"
#include "MatchaUtil/Exceptions.h"
#include "MatchaUtil/String.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <map>
#include <vector>

using namespace Matcha;

// The shared sinks and the loggers with explicitly set levels.
static std::vector<Log::sinkptr_t> g_sinks;
static std::map<std::string, spdlog::level::level_enum> g_explicit;

static spdlog::level::level_enum parse_level(const std::string& level)
{
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        raise<ValueError>("unknown log level: \"%s\"", level);
    }
    return lvl;
}

static void add_sink(Log::sinkptr_t sink, const std::string& level)
{
    if (!level.empty()) {
        sink->set_level(parse_level(level));
    }
    // first sink replaces spdlog's own default console sink
    if (g_sinks.empty()) {
        spdlog::default_logger()->sinks().clear();
    }
    g_sinks.push_back(sink);
    spdlog::default_logger()->sinks().push_back(sink);
}

void Log::add_file(std::string filename, std::string level)
{
    add_sink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true), level);
}

void Log::add_stdout(bool color, std::string level)
{
    if (color) {
        add_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), level);
    }
    else {
        add_sink(std::make_shared<spdlog::sinks::stdout_sink_mt>(), level);
    }
}

void Log::add_stderr(bool color, std::string level)
{
    if (color) {
        add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), level);
    }
    else {
        add_sink(std::make_shared<spdlog::sinks::stderr_sink_mt>(), level);
    }
}

Log::logptr_t Log::logger(std::string name)
{
    auto have = spdlog::get(name);
    if (have) {
        return have;
    }
    auto log = std::make_shared<spdlog::logger>(name, g_sinks.begin(), g_sinks.end());
    log->set_level(spdlog::default_logger()->level());
    spdlog::register_logger(log);
    return log;
}

void Log::set_level(std::string level, std::string which)
{
    auto lvl = parse_level(level);

    if (which.empty()) {
        spdlog::set_level(lvl);
        for (auto& [name, have] : g_explicit) {
            have = lvl;
        }
        return;
    }
    logger(which)->set_level(lvl);
    g_explicit[which] = lvl;
}

void Log::fill_levels()
{
    spdlog::apply_all([](logptr_t log) {
        const std::string& name = log->name();
        if (g_explicit.count(name)) {
            return;
        }
        size_t best = 0;
        for (const auto& [have, lvl] : g_explicit) {
            if (have.size() <= best || !String::startswith(name, have)) {
                continue;
            }
            best = have.size();
            log->set_level(lvl);
        }
    });
}
