#include "MatchaApps/TrackPointCli.h"
#include "MatchaApps/TrackPointShifter.h"
#include "MatchaUtil/Exceptions.h"
#include "MatchaUtil/Logging.h"
#include "MatchaUtil/Persist.h"
#include "MatchaUtil/String.h"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;
using namespace Matcha;

using spdlog::debug;
using spdlog::error;
using spdlog::info;

static void setup_logging(const po::variables_map& opts)
{
    if (opts.count("logsink")) {
        for (auto ls : opts["logsink"].as<std::vector<std::string> >()) {
            auto [sink, level] = String::parse_pair(ls, ":");
            if (sink == "stdout") {
                Log::add_stdout(true, level);
            }
            else if (sink == "stderr") {
                Log::add_stderr(true, level);
            }
            else {
                Log::add_file(sink, level);
            }
        }
    }
    else {
        Log::add_stderr(true);
    }
    if (opts.count("loglevel")) {
        for (auto ll : opts["loglevel"].as<std::vector<std::string> >()) {
            auto [name, level] = String::parse_pair(ll, ":");
            if (level.empty()) {
                Log::set_level(name);
            }
            else {
                Log::set_level(level, name);
            }
        }
        Log::fill_levels();
    }
}

// Command line values override those from the file.
static Configuration make_config(const po::variables_map& opts, const Configuration& defcfg)
{
    auto cfg = defcfg;
    if (opts.count("config")) {
        const auto filename = opts["config"].as<std::string>();
        debug("loading configuration from {}", filename);
        auto jcfg = Persist::load(filename);
        if (!jcfg.isObject()) {
            raise<ConfigurationError>("%s does not hold a JSON object", filename);
        }
        update(cfg, jcfg);
    }
    if (opts.count("drift-velocity")) {
        cfg["drift_velocity"] = opts["drift-velocity"].as<double>();
    }
    return cfg;
}

int Matcha::Apps::trackpoint_cli(int argc, const char* const argv[])
{
    po::options_description desc(
        "Classify and shift track end points\n\n"
        "Usage:\n\tmatcha-trackpoint [options] points.json\n\nOptions");
    desc.add_options()("help,h", "produce help message")

        ("logsink,l", po::value<std::vector<std::string> >(),
         "set log sink as <filename> or 'stdout' or 'stderr', "
         "a log level for the sink may be given by appending ':<level>'")

        ("loglevel,L", po::value<std::vector<std::string> >(),
         "set lowest log level for a log in form 'name:level' "
         "or just give 'level' value for all "
         "(level one of: critical,error,warn,info,debug,trace)")

        ("config,c", po::value<std::string>(),
         "JSON file with drift configuration (boundaries, drift_velocity, skip_undefined)")

        ("drift-velocity,v", po::value<double>(),
         "drift velocity in cm/us, overrides the configuration file")

        ("t0,t", po::value<double>(),
         "shift points by this t0 in us")

        ("output,o", po::value<std::string>()->default_value("-"),
         "output JSON file, '-' for stdout")

        ("input", po::value<std::string>(), "input JSON file of track points");

    po::positional_options_description pos;
    pos.add("input", 1);

    po::variables_map opts;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), opts);
        po::notify(opts);
    }
    catch (const po::error& err) {
        std::cerr << err.what() << "\n" << desc << "\n";
        return 1;
    }

    if (opts.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }
    if (!opts.count("input")) {
        std::cerr << "no input file given\n" << desc << "\n";
        return 1;
    }

    try {
        setup_logging(opts);

        Apps::TrackPointShifter shifter;
        shifter.configure(make_config(opts, shifter.default_configuration()));

        const auto input = opts["input"].as<std::string>();
        auto jpoints = Persist::load(input);
        if (!jpoints.isArray()) {
            raise<ConfigurationError>("%s does not hold an array of track points", input);
        }

        std::vector<TrackPoint> points;
        for (const auto& jpt : jpoints) {
            points.push_back(TrackPoint::from_json(jpt, shifter.drift().boundaries()));
        }
        info("read {} track points from {}", points.size(), input);

        if (opts.count("t0")) {
            const double t0 = opts["t0"].as<double>();
            const size_t nshifted = shifter.shift(points, t0);
            info("shifted {} points by t0={} us, {} without drift direction",
                 nshifted, t0, shifter.nskipped());
        }

        Configuration jout(Json::arrayValue);
        for (const auto& tp : points) {
            jout.append(tp.to_json());
        }
        Persist::dump(opts["output"].as<std::string>(), jout, true);
    }
    catch (const Exception& err) {
        error("{}", err.what());
        return 2;
    }
    catch (const Json::Exception& err) {
        error("bad JSON value: {}", err.what());
        return 2;
    }

    return 0;
}
