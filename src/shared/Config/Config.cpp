/*
 * Copyright (C) 2026 Solaris
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "Config.h"
#include "logging.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdlib>
#include <fstream>

static std::string env_name(const std::string& name)
{
    std::string env = SOLARIS_ENV_PREFIX + boost::algorithm::to_upper_copy(name);
    boost::algorithm::replace_all(env, ".", "_");
    return env;
}

bool Config::SetSource(const std::string& filename)
{
    using namespace boost::program_options;

    mFilename = filename;
    mValues.clear();
    mValidSource = false;

    std::ifstream in(filename.c_str());
    if (!in.good())
        return false;

    try
    {
        // Nothing is registered: every key comes back as unregistered and is
        // kept as a raw string, converted on lookup.
        options_description desc;
        parsed_options parsed = parse_config_file(in, desc, true);
        for (auto& opt : parsed.options)
        {
            if (opt.value.empty())
                continue;
            mValues[opt.string_key] = opt.value.back();
        }
    }
    catch (error& e)
    {
        logging.error("Config: unable to parse %s: %s", filename.c_str(),
            e.what());
        return false;
    }

    mValidSource = true;
    return true;
}

bool Config::lookup(const std::string& name, std::string& value) const
{
    if (const char* env = std::getenv(env_name(name).c_str()))
    {
        value = env;
        return true;
    }

    if (!mValidSource)
        return false;

    auto itr = mValues.find(name);
    if (itr == mValues.end())
        return false;

    value = itr->second;
    return true;
}

std::string Config::GetStringDefault(const char* name, const std::string& def)
{
    std::string str;
    if (!lookup(name, str))
        return def;

    boost::algorithm::trim(str);
    // Pop quotes if needed
    if (!str.empty() && str[0] == '"')
    {
        str.erase(str.begin());
        if (!str.empty() && str[str.size() - 1] == '"')
            str.erase(str.end() - 1);
    }
    return str;
}

bool Config::GetBoolDefault(const char* name, bool def)
{
    std::string str;
    if (!lookup(name, str))
        return def;

    boost::algorithm::trim(str);
    boost::algorithm::to_lower(str);
    if (str == "1" || str == "true" || str == "yes" || str == "on")
        return true;
    if (str == "0" || str == "false" || str == "no" || str == "off")
        return false;

    logging.warning("Config: %s has non-boolean value '%s', using default",
        name, str.c_str());
    return def;
}

int32 Config::GetIntDefault(const char* name, int32 def)
{
    std::string str;
    if (!lookup(name, str))
        return def;

    try
    {
        return boost::lexical_cast<int32>(boost::algorithm::trim_copy(str));
    }
    catch (boost::bad_lexical_cast&)
    {
        logging.warning("Config: %s has non-integer value '%s', using default",
            name, str.c_str());
        return def;
    }
}

void Config::LoadLogLevels()
{
    if (!mValidSource)
        return;

    boost::property_tree::ptree pt;
    try
    {
        boost::property_tree::ini_parser::read_ini(mFilename, pt);
    }
    catch (boost::property_tree::ini_parser_error& e)
    {
        logging.error("Config: [LOGGERS] not loaded: %s", e.what());
        return;
    }

    auto section = pt.get_child_optional("LOGGERS");
    if (!section)
        return;

    for (auto& key : *section)
    {
        std::string value = GetStringDefault(
            ("LOGGERS." + key.first).c_str(), key.second.data());
        LogLevel level;
        if (!parse_log_level(value, level))
        {
            logging.warning("Config: unknown log level '%s' for logger %s",
                value.c_str(), key.first.c_str());
            continue;
        }
        logging.get_logger(key.first).set_level(level);
    }
}
