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

#ifndef SOLARIS_CONFIG_H
#define SOLARIS_CONFIG_H

#include "Platform/Define.h"
#include "Policies/Singleton.h"
#include <map>
#include <string>

#define SOLARIS_ENV_PREFIX "SOLARIS_"

/* INI-style configuration ("Key = Value", optional [SECTION]s).
 * Every key can be overridden from the environment: "MaxDepth" is looked up
 * as SOLARIS_MAXDEPTH, "LOGGERS.parse" as SOLARIS_LOGGERS_PARSE. The
 * environment is consulted even when no file has been loaded.
 */
class Config
{
public:
    Config() : mValidSource(false) {}

    // Reads and caches the whole file. Returns false if it can't be opened
    // or parsed; previously loaded values are dropped either way.
    bool SetSource(const std::string& filename);

    std::string GetStringDefault(const char* name, const std::string& def);
    bool GetBoolDefault(const char* name, const bool def = false);
    int32 GetIntDefault(const char* name, const int32 def);

    std::string GetFilename() const { return mFilename; }

    // Applies the [LOGGERS] section: "<logger> = <level>"
    void LoadLogLevels();

private:
    bool lookup(const std::string& name, std::string& value) const;

    bool mValidSource;
    std::string mFilename;
    std::map<std::string, std::string> mValues;
};

#define sConfig solaris::UnlockedSingleton<Config>

#endif
