// Copyright (C) 2024 by Brenton Bostick
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and
// associated documentation files (the "Software"), to deal in the Software without restriction,
// including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do
// so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all copies or substantial
// portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
// FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS
// OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
// WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
// CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "run-splitter.h"

#include "run-splitter/run-splitter-util.h"

#include "common/assert.h"
#include "common/check.h"
#include "common/file.h"
#include "common/logging.h"

#include <cinttypes>
#include <cstddef> // for ptrdiff_t
#include <cstring>
#include <cstdio>
#include <utility>


#define TAG "runs"


const char *splitModeString(split_mode mode) {

    switch (mode) {
    case MODE_BEFORE:
        return "before";
    case MODE_AFTER:
        return "after";
    default:
        return "unknown";
    }
}


Status parseSplitMode(const char *text, split_mode &out) {

    CHECK(text, "split mode is null");

    if (strcmp(text, "before") == 0) {

        out = MODE_BEFORE;

        return OK;

    } else if (strcmp(text, "after") == 0) {

        out = MODE_AFTER;

        return OK;
    }

    LOGE("unrecognized split mode: %s", text);

    return ERR;
}


Status splitBytes(
    const std::vector<uint8_t> &data,
    const split_opts &opts,
    std::vector<byte_run> &out) {

    CHECK(opts.mode == MODE_BEFORE || opts.mode == MODE_AFTER, "unrecognized split mode: %d", opts.mode);

    std::vector<byte_run> acc;

    auto begin = data.cbegin();

    auto s = splitWithMode(begin, data.cend(), byte_set_matcher{ opts.match }, opts.mode);

    while (auto run = s.next()) {

        ASSERT(!run->empty());

        acc.push_back(byte_run{
            static_cast<size_t>(run->first - begin),
            run->size(),
            runChecksum(run->first, run->last) });
    }

    ASSERT(s.done());

    LOGD("split %zu bytes into %zu runs (%s)", data.size(), acc.size(), splitModeString(opts.mode));

    out = std::move(acc);

    return OK;
}


Status splitFile(
    const char *path,
    bool inflate,
    const split_opts &opts,
    std::vector<uint8_t> &data,
    std::vector<byte_run> &out) {

    std::vector<uint8_t> buf;

    Status ret = openFile(path, buf);

    if (ret != OK) {
        return ret;
    }

    if (inflate) {

        std::vector<uint8_t> inflated;

        auto it = buf.cbegin();

        ret = zlibInflate(it, buf.cend(), inflated);

        if (ret != OK) {
            return ret;
        }

        if (it != buf.cend()) {
            LOGW("ignoring %zu bytes after end of zlib stream", static_cast<size_t>(buf.cend() - it));
        }

        LOGI("inflated %zu bytes to %zu bytes", buf.size(), inflated.size());

        buf = std::move(inflated);
    }

    ret = splitBytes(buf, opts, out);

    if (ret != OK) {
        return ret;
    }

    data = std::move(buf);

    return OK;
}


std::string runsReport(
    const std::vector<uint8_t> &data,
    const std::vector<byte_run> &runs,
    const split_opts &opts) {

    std::string acc;

    char buf[128];

    snprintf(buf, sizeof(buf), "mode: %s, bytes: %zu, runs: %zu\n", splitModeString(opts.mode), data.size(), runs.size());

    acc += buf;

    for (size_t i = 0; i < runs.size(); i++) {

        const auto &r = runs[i];

        snprintf(buf, sizeof(buf), "run %zu: offset %zu, length %zu, crc32 0x%08" PRIx32 ":", i, r.offset, r.length, r.crc32);

        acc += buf;

        if (r.offset + r.length <= data.size()) {

            auto first = data.cbegin() + static_cast<std::ptrdiff_t>(r.offset);

            auto last = first + static_cast<std::ptrdiff_t>(r.length);

            acc += ' ';

            acc += hexPreview(first, last, opts.preview_bytes);
        }

        acc += '\n';
    }

    return acc;
}


Status exportRuns(
    const std::vector<uint8_t> &data,
    const std::vector<byte_run> &runs,
    const char *prefix) {

    CHECK(prefix && *prefix, "output prefix is empty");

    for (size_t i = 0; i < runs.size(); i++) {

        const auto &r = runs[i];

        CHECK(r.offset + r.length <= data.size(), "run %zu is out of range", i);

        std::string path = std::string(prefix) + "." + std::to_string(i);

        auto first = data.cbegin() + static_cast<std::ptrdiff_t>(r.offset);

        Status ret = saveFile(path.c_str(), first, first + static_cast<std::ptrdiff_t>(r.length));

        if (ret != OK) {
            return ret;
        }

        LOGD("wrote %s (%zu bytes)", path.c_str(), r.length);
    }

    return OK;
}
