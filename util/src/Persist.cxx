#include "MatchaUtil/Persist.h"
#include "MatchaUtil/Exceptions.h"

#include <boost/filesystem.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using namespace Matcha;

bool Matcha::Persist::exists(const std::string& filename)
{
    return boost::filesystem::exists(filename);
}

Configuration Matcha::Persist::loads(const std::string& text)
{
    Json::CharReaderBuilder rb;
    rb["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(rb.newCharReader());

    Configuration ret;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &ret, &errs)) {
        raise<ConfigurationError>("failed to parse JSON text: %s", errs);
    }
    return ret;
}

Configuration Matcha::Persist::load(const std::string& filename)
{
    if (!exists(filename)) {
        raise<IOError>("no such file: %s", filename);
    }
    std::ifstream fstr(filename);
    if (!fstr) {
        raise<IOError>("failed to open file: %s", filename);
    }
    std::stringstream ss;
    ss << fstr.rdbuf();

    Configuration ret;
    try {
        ret = loads(ss.str());
    }
    catch (ConfigurationError& err) {
        raise<ConfigurationError>("failed to parse %s: %s", filename, errmsg(err));
    }
    return ret;
}

std::string Matcha::Persist::dumps(const Configuration& cfg, bool pretty)
{
    Json::StreamWriterBuilder wb;
    if (pretty) {
        wb["indentation"] = "    ";
    }
    else {
        wb["indentation"] = "";
    }
    return Json::writeString(wb, cfg);
}

void Matcha::Persist::dump(const std::string& filename, const Configuration& cfg, bool pretty)
{
    const std::string text = dumps(cfg, pretty);
    if (filename == "-") {
        std::cout << text << "\n";
        return;
    }
    std::ofstream fstr(filename);
    if (!fstr) {
        raise<IOError>("failed to open file for writing: %s", filename);
    }
    fstr << text << "\n";
    if (!fstr) {
        raise<IOError>("failed to write file: %s", filename);
    }
}
