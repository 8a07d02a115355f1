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

#define _CRT_SECURE_NO_DEPRECATE // disable warnings about fopen being insecure on MSVC

#include "common/file.h"

#include "common/check.h"
#include "common/logging.h"

#include <cstdio>
#include <cstring>
#include <utility>


#define TAG "file"


#define READ_CHUNK 65536


Status
openFile(
    const char *path,
    std::vector<uint8_t> &out) {

    CHECK(path, "path is null");

    bool useStdin = (strcmp(path, "-") == 0);

    FILE *file = useStdin ? stdin : fopen(path, "rb");

    CHECK(file, "cannot open %s", path);

    //
    // stdin may be a pipe, so no fseek / ftell
    //
    std::vector<uint8_t> acc;

    uint8_t buf[READ_CHUNK];

    size_t r;

    do {

        r = fread(buf, sizeof(uint8_t), READ_CHUNK, file);

        acc.insert(acc.end(), buf, buf + r);

    } while (r == READ_CHUNK);

    bool failed = (ferror(file) != 0);

    if (!useStdin) {

        int fres = fclose(file);

        CHECK_NOT(fres, "fclose failed");
    }

    CHECK_NOT(failed, "fread failed: %s", path);

    out = std::move(acc);

    return OK;
}


Status
saveFile(
    const char *path,
    std::vector<uint8_t>::const_iterator first,
    std::vector<uint8_t>::const_iterator last) {

    CHECK(path, "path is null");

    FILE *file = fopen(path, "wb");

    CHECK(file, "cannot open %s", path);

    auto len = static_cast<size_t>(last - first);

    size_t r = 0;

    if (len != 0) {
        r = fwrite(&*first, sizeof(uint8_t), len, file);
    }

    int fres = fclose(file);

    CHECK(r == len, "fwrite failed: %s", path);

    CHECK_NOT(fres, "fclose failed");

    return OK;
}
