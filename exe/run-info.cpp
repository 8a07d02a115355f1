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

#include "common/logging.h"

#include <string>
#include <cstring>
#include <cstdlib>


#define TAG "run-info"


void printUsage();


int main(int argc, const char *argv[]) {

    LOGI("run info v1.0.0");

    if (argc == 1) {
        printUsage();
        return EXIT_SUCCESS;
    }

    std::string inputFile;
    std::string matchList = "0x0a";

    bool inflate = false;

    split_opts opts;

    for (int i = 1; i < argc; i++) {

        if (strcmp(argv[i], "--input-file") == 0) {

            if (i == argc - 1) {
                printUsage();
                return EXIT_FAILURE;
            }

            i++;

            inputFile = argv[i];

        } else if (strcmp(argv[i], "--mode") == 0) {

            if (i == argc - 1) {
                printUsage();
                return EXIT_FAILURE;
            }

            i++;

            if (parseSplitMode(argv[i], opts.mode) != OK) {
                printUsage();
                return EXIT_FAILURE;
            }

        } else if (strcmp(argv[i], "--match") == 0) {

            if (i == argc - 1) {
                printUsage();
                return EXIT_FAILURE;
            }

            i++;

            matchList = argv[i];

        } else if (strcmp(argv[i], "--inflate") == 0) {

            inflate = true;

        } else if (strcmp(argv[i], "--preview") == 0) {

            if (i == argc - 1) {
                printUsage();
                return EXIT_FAILURE;
            }

            i++;

            char *endp;

            long preview = strtol(argv[i], &endp, 10);

            if (*argv[i] == '\0' || *endp != '\0' || preview < 0) {
                printUsage();
                return EXIT_FAILURE;
            }

            opts.preview_bytes = static_cast<size_t>(preview);

        } else if (strcmp(argv[i], "--output-prefix") == 0) {

            if (i == argc - 1) {
                printUsage();
                return EXIT_FAILURE;
            }

            i++;

            opts.output_prefix = argv[i];

        } else {

            LOGE("unrecognized option: %s", argv[i]);

            printUsage();

            return EXIT_FAILURE;
        }
    }

    if (inputFile.empty()) {
        LOGE("input file is missing (or --input-file is not specified)");
        return EXIT_FAILURE;
    }

    if (parseByteSet(matchList.c_str(), opts.match) != OK) {
        printUsage();
        return EXIT_FAILURE;
    }

    LOGI("input file: %s", inputFile.c_str());
    LOGI("mode: %s", splitModeString(opts.mode));
    LOGI("match: %s", matchList.c_str());
    LOGI("inflate: %d", inflate);

    std::vector<uint8_t> data;
    std::vector<byte_run> runs;

    Status ret = splitFile(inputFile.c_str(), inflate, opts, data, runs);

    if (ret != OK) {
        return EXIT_FAILURE;
    }

    auto report = runsReport(data, runs, opts);

    LOGI("%s", report.c_str());

    if (!opts.output_prefix.empty()) {

        LOGI("exporting...");

        ret = exportRuns(data, runs, opts.output_prefix.c_str());

        if (ret != OK) {
            return EXIT_FAILURE;
        }

        LOGI("wrote %zu files with prefix %s", runs.size(), opts.output_prefix.c_str());
    }

    return EXIT_SUCCESS;
}


void printUsage() {
    LOGI("usage: run-info --input-file XXX [options]");
    LOGI("XXX may be - to read stdin");
    LOGI("options:");
    LOGI("--mode (before|after)      where a matched byte goes (default before)");
    LOGI("--match LIST               comma separated byte values, e.g. 10,0x0d (default 0x0a)");
    LOGI("--inflate                  input is a zlib stream");
    LOGI("--preview N                bytes shown per run (default 8)");
    LOGI("--output-prefix PREFIX     write run k to PREFIX.k");
}
