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

#ifndef SOLARIS_PARSE__BATCH_H
#define SOLARIS_PARSE__BATCH_H

#include "decode/document.h"
#include "decode/schema.h"
#include <string>
#include <vector>

namespace solaris
{
namespace parse
{
class schema_registry;

enum class job_status
{
    ok,
    failed,
    missing // source file not in the source directory
};

const char* job_status_name(job_status status);

struct job_result
{
    job_result()
      : status(job_status::missing), size(0), consumed(0), empty(false),
        source_crc(0), output_crc(0)
    {
    }

    std::string schema;
    std::string source_file;
    std::string output_file;
    job_status status;
    std::string error; // set when status is failed
    size_t size;
    size_t consumed;
    bool empty;
    uint32 source_crc;
    uint32 output_crc; // of the written JSON, 0 if nothing was written
};

struct batch_options
{
    batch_options() : threads(0), write_output(true), write_manifest(true) {}

    std::string source_dir;
    std::string output_dir;
    unsigned int threads; // 0: one per hardware thread
    decode::decode_options decode;
    bool write_output;
    bool write_manifest;
    std::vector<std::string> only; // schema names; empty runs everything
};

/* Decodes every catalogued client file found in the source directory and
 * writes one JSON document per file to the output directory.
 *
 * Each job owns its buffer and cursor; a job that throws is recorded as
 * failed and the rest of the batch carries on.
 */
class batch_runner
{
public:
    batch_runner(const schema_registry& registry, batch_options opts);

    // Results are in registration order regardless of thread scheduling
    std::vector<job_result> run();

    // Decodes a single schema's file; used by the workers
    job_result run_one(const decode::document_schema& schema) const;

    const batch_options& options() const { return opts_; }

private:
    unsigned int worker_count(size_t jobs) const;

    const schema_registry& registry_;
    batch_options opts_;
};

// 0 if no job failed, 1 otherwise. Missing sources don't count.
int batch_exit_code(const std::vector<job_result>& results);
}
}

#endif
