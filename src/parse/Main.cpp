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

/// \addtogroup parse Client data decoder
/// @{
/// \file

#include "logging.h"
#include "Config/Config.h"
#include "parse/batch.h"
#include "parse/schema_registry.h"
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <iostream>

#ifndef _SOLARIS_PARSE_CONFIG
#define _SOLARIS_PARSE_CONFIG "solaris-parse.conf"
#endif

/// Decode the client's binary config files into JSON
extern int main(int argc, char** argv)
{
    ///- Command line parsing
    std::string cfg_file(_SOLARIS_PARSE_CONFIG);

    namespace po = boost::program_options;
    po::options_description desc("Options recognized by solaris-parse");
    desc.add_options()("help,h,?", "displays this help")(
        "config,c", po::value<std::string>(), "overrides default config file")(
        "source-dir", po::value<std::string>(), "directory with *.bytes files")(
        "output-dir", po::value<std::string>(), "directory for the json files")(
        "schema-dir", po::value<std::string>(),
        "extra schema descriptors (*.json)")(
        "list-parsers,l", "lists the known files and exits")(
        "threads", po::value<int>(), "worker threads, 0 for one per core")(
        "max-depth", po::value<int>(), "nesting ceiling per document")(
        "strict", "bytes after the root record fail the document")(
        "schema", po::value<std::vector<std::string>>(),
        "only decode these schemas");

    po::positional_options_description positional;
    positional.add("schema", -1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
            vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n" << desc << "\n";
        return 1;
    }

    if (vm.count("help"))
    {
        std::cout << desc << "\n";
        return 0;
    }

    // The default file is optional, an explicit one is not
    if (vm.count("config"))
    {
        cfg_file = vm["config"].as<std::string>();
        if (!sConfig::Instance()->SetSource(cfg_file))
        {
            logging.error(
                "Could not find configuration file %s.", cfg_file.c_str());
            return 1;
        }
        logging.info("Using configuration file %s.", cfg_file.c_str());
    }
    else if (boost::filesystem::exists(cfg_file))
    {
        if (!sConfig::Instance()->SetSource(cfg_file))
        {
            logging.error(
                "Could not parse configuration file %s.", cfg_file.c_str());
            return 1;
        }
        logging.info("Using configuration file %s.", cfg_file.c_str());
    }

    // Loggers
    sConfig::Instance()->LoadLogLevels();

    Config* config = sConfig::Instance();

    ///- Schemas: built-in first, descriptor files may replace them
    solaris::parse::schema_registry* registry = sSchemaRegistry::Instance();
    registry->add_builtin();

    std::string schema_dir = config->GetStringDefault("SchemaDir", "");
    if (vm.count("schema-dir"))
        schema_dir = vm["schema-dir"].as<std::string>();
    if (!schema_dir.empty() && registry->load_directory(schema_dir) != 0)
        logging.warning("Some schema descriptors in %s were skipped",
            schema_dir.c_str());

    if (vm.count("list-parsers"))
    {
        std::cout << registry->describe();
        return 0;
    }

    ///- Batch settings, command line over config file
    solaris::parse::batch_options opts;
    opts.source_dir = config->GetStringDefault("SourceDir", "source");
    opts.output_dir = config->GetStringDefault("OutputDir", "output");
    int threads = config->GetIntDefault("Threads", 0);
    opts.decode.max_depth =
        config->GetIntDefault("MaxDepth", SOLARIS_DEFAULT_MAX_DEPTH);
    opts.decode.strict = config->GetBoolDefault("StrictTrailingBytes", false);
    opts.write_manifest = config->GetBoolDefault("WriteManifest", true);

    if (vm.count("source-dir"))
        opts.source_dir = vm["source-dir"].as<std::string>();
    if (vm.count("output-dir"))
        opts.output_dir = vm["output-dir"].as<std::string>();
    if (vm.count("threads"))
        threads = vm["threads"].as<int>();
    if (vm.count("max-depth"))
        opts.decode.max_depth = vm["max-depth"].as<int>();
    if (vm.count("strict"))
        opts.decode.strict = true;
    if (vm.count("schema"))
        opts.only = vm["schema"].as<std::vector<std::string>>();

    if (threads < 0 || opts.decode.max_depth < 1)
    {
        logging.error("Threads must be >= 0 and MaxDepth >= 1");
        return 1;
    }
    opts.threads = static_cast<unsigned int>(threads);

    if (!boost::filesystem::is_directory(opts.source_dir))
    {
        logging.error(
            "Source directory %s does not exist.", opts.source_dir.c_str());
        return 1;
    }

    solaris::parse::batch_runner runner(*registry, opts);
    return solaris::parse::batch_exit_code(runner.run());
}

/// @}
