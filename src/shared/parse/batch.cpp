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

#include "parse/batch.h"
#include "LockedQueue.h"
#include "Util.h"
#include "logging.h"
#include "decode/decode_error.h"
#include "parse/output.h"
#include "parse/schema_registry.h"
#include <boost/filesystem.hpp>
#include <thread>

namespace fs = boost::filesystem;

namespace solaris
{
namespace parse
{
const char* job_status_name(job_status status)
{
    switch (status)
    {
    case job_status::ok:
        return "ok";
    case job_status::failed:
        return "failed";
    case job_status::missing:
        return "missing";
    }
    return "unknown";
}

batch_runner::batch_runner(const schema_registry& registry, batch_options opts)
  : registry_(registry), opts_(std::move(opts))
{
}

std::vector<job_result> batch_runner::run()
{
    auto& log = logging.get_logger("parse.batch");

    std::vector<const decode::document_schema*> schemas;
    std::vector<job_result> results;
    if (opts_.only.empty())
    {
        for (auto& schema : registry_.schemas())
            schemas.push_back(&schema);
    }
    else
    {
        for (auto& name : opts_.only)
        {
            const decode::document_schema* schema = registry_.find(name);
            if (!schema)
            {
                log.error("No schema named %s", name.c_str());
                job_result r;
                r.schema = name;
                r.status = job_status::failed;
                r.error = "unknown schema";
                results.push_back(r);
                continue;
            }
            schemas.push_back(schema);
        }
    }

    // Slots are filled in place so ordering doesn't depend on the workers
    size_t first = results.size();
    results.resize(first + schemas.size());

    locked_queue<size_t> jobs;
    for (size_t i = 0; i < schemas.size(); ++i)
    {
        job_result& r = results[first + i];
        r.schema = schemas[i]->name;
        r.source_file = schemas[i]->source_file;
        r.output_file = schemas[i]->output_file;

        fs::path source = fs::path(opts_.source_dir) / r.source_file;
        boost::system::error_code ec;
        if (!fs::is_regular_file(source, ec))
        {
            log.warning("%s not found in %s, skipping %s",
                r.source_file.c_str(), opts_.source_dir.c_str(),
                r.schema.c_str());
            continue;
        }
        jobs.push(i);
    }

    size_t queued = jobs.size();
    unsigned int workers = worker_count(queued);
    log.info("Decoding %zu files with %u threads", queued, workers);

    auto work = [&]()
    {
        size_t index;
        while (jobs.pop(index))
            results[first + index] = run_one(*schemas[index]);
    };

    std::vector<std::thread> threads;
    for (unsigned int i = 1; i < workers; ++i)
        threads.emplace_back(work);
    work();
    for (auto& t : threads)
        t.join();

    if (opts_.write_manifest && opts_.write_output)
    {
        if (!write_manifest(opts_.output_dir, results))
            log.error("Could not write %s to %s", SOLARIS_MANIFEST_FILE,
                opts_.output_dir.c_str());
    }

    size_t ok = 0, failed = 0;
    for (auto& r : results)
    {
        if (r.status == job_status::ok)
            ++ok;
        else if (r.status == job_status::failed)
            ++failed;
    }
    log.info("Done: %zu decoded, %zu failed", ok, failed);

    return results;
}

job_result batch_runner::run_one(const decode::document_schema& schema) const
{
    auto& log = logging.get_logger("parse.batch");

    job_result r;
    r.schema = schema.name;
    r.source_file = schema.source_file;
    r.output_file = schema.output_file;
    r.status = job_status::failed;

    fs::path source = fs::path(opts_.source_dir) / schema.source_file;
    try
    {
        std::vector<uint8> buf;
        if (!ReadFileBytes(source.string(), buf))
        {
            r.error = "could not read " + source.string();
            log.error("%s: %s", schema.name.c_str(), r.error.c_str());
            return r;
        }
        r.size = buf.size();
        r.source_crc = Crc32(buf.empty() ? nullptr : &buf[0], buf.size());

        decode::document_result res =
            decode::decode_document(buf, schema, opts_.decode);
        r.consumed = res.consumed;
        r.empty = res.empty;

        if (res.has_trailing_bytes())
            log.warning("%s: %zu trailing bytes after offset %zu",
                schema.source_file.c_str(), res.size - res.consumed,
                res.consumed);

        if (opts_.write_output)
        {
            std::string text = dump_document(res.doc);
            fs::path output = fs::path(opts_.output_dir) / schema.output_file;
            if (!WriteFileText(output.string(), text))
            {
                r.error = "could not write " + output.string();
                log.error("%s: %s", schema.name.c_str(), r.error.c_str());
                return r;
            }
            r.output_crc = Crc32(text);
        }

        r.status = job_status::ok;
        LOG_DEBUG(log, "%s -> %s (%zu/%zu bytes)", schema.source_file.c_str(),
            schema.output_file.c_str(), r.consumed, r.size);
    }
    catch (decode::decode_error& e)
    {
        r.error = e.what();
        log.error("%s: %s", schema.source_file.c_str(), e.what());
    }
    catch (std::exception& e)
    {
        r.error = e.what();
        log.error("%s: unexpected error: %s", schema.source_file.c_str(),
            e.what());
    }

    return r;
}

unsigned int batch_runner::worker_count(size_t jobs) const
{
    unsigned int n = opts_.threads;
    if (n == 0)
        n = std::thread::hardware_concurrency();
    if (n == 0)
        n = 1;
    if (jobs < n)
        n = jobs == 0 ? 1 : static_cast<unsigned int>(jobs);
    return n;
}

int batch_exit_code(const std::vector<job_result>& results)
{
    for (auto& r : results)
        if (r.status == job_status::failed)
            return 1;
    return 0;
}
}
}
