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

#pragma once

#include "common/status.h"

#include "run-splitter/split-inc.h"

#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef> // for size_t


const size_t BYTE_VALUE_COUNT = 256;

//
// membership table indexed by byte value
//
using byte_set = std::array<bool, BYTE_VALUE_COUNT>;

struct byte_set_matcher {

    byte_set set;

    bool operator()(uint8_t b) const {
        return set[b];
    }
};


struct split_opts {

    split_mode mode = MODE_BEFORE;

    byte_set match{};

    //
    // number of leading bytes shown per run in runsReport
    //
    size_t preview_bytes = 8;

    //
    // when not empty, run k is written to <output_prefix>.<k>
    //
    std::string output_prefix;
};

struct byte_run {
    size_t offset;
    size_t length;
    uint32_t crc32;
};


Status splitBytes(
    const std::vector<uint8_t> &data,
    const split_opts &opts,
    std::vector<byte_run> &out);

Status splitFile(
    const char *path,
    bool inflate,
    const split_opts &opts,
    std::vector<uint8_t> &data,
    std::vector<byte_run> &out);

std::string runsReport(
    const std::vector<uint8_t> &data,
    const std::vector<byte_run> &runs,
    const split_opts &opts);

Status exportRuns(
    const std::vector<uint8_t> &data,
    const std::vector<byte_run> &runs,
    const char *prefix);

const char *splitModeString(split_mode mode);

Status parseSplitMode(const char *text, split_mode &out);
