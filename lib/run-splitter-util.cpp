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

#include "run-splitter/run-splitter-util.h"

#include "common/check.h"
#include "common/logging.h"

#include "zlib.h"

#include <climits> // for UINT_MAX
#include <cstddef> // for ptrdiff_t
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>


#define TAG "run-splitter-util"


#define CHUNK 16384


void zerr(int ret);


Status parseByteSet(const char *text, byte_set &out) {

    CHECK(text, "byte list is null");

    CHECK(*text != '\0', "byte list is empty");

    byte_set acc{};

    const char *p = text;

    while (true) {

        while (*p == ' ') {
            p++;
        }

        int base = 10;

        if (p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) {
            base = 16;
            p += 2;
        }

        //
        // strtoul would also accept sign and whitespace here
        //
        if (base == 16) {
            CHECK(isxdigit(static_cast<unsigned char>(*p)), "expected hex byte value at: \"%s\"", p);
        } else {
            CHECK(isdigit(static_cast<unsigned char>(*p)), "expected byte value at: \"%s\"", p);
        }

        char *endp;

        errno = 0;

        unsigned long v = strtoul(p, &endp, base);

        CHECK(errno == 0 && v < BYTE_VALUE_COUNT, "byte value out of range at: \"%s\"", p);

        acc[v] = true;

        p = endp;

        while (*p == ' ') {
            p++;
        }

        if (*p == '\0') {
            break;
        }

        CHECK(*p == ',', "unexpected character '%c' in byte list \"%s\"", *p, text);

        p++;
    }

    out = acc;

    return OK;
}


uint32_t runChecksum(
    std::vector<uint8_t>::const_iterator first,
    std::vector<uint8_t>::const_iterator last) {

    uLong crc = crc32_z(0L, Z_NULL, 0);

    if (first == last) {
        return static_cast<uint32_t>(crc);
    }

    crc = crc32_z(crc, &*first, static_cast<z_size_t>(last - first));

    return static_cast<uint32_t>(crc);
}


//
// adapted from zlib's zpipe.c
//
// it is left just past the end of the zlib stream
//
Status
zlibInflate(
    std::vector<uint8_t>::const_iterator &it,
    const std::vector<uint8_t>::const_iterator end,
    std::vector<uint8_t> &acc) {

    CHECK(it < end, "zlibInflate: no input");

    CHECK(static_cast<size_t>(end - it) <= UINT_MAX, "zlibInflate: input too large");

    int ret;
    unsigned have;
    z_stream strm;

    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;
    ret = inflateInit(&strm);
    if (ret != Z_OK) {
        zerr(ret);
        return ERR;
    }

    strm.avail_in = static_cast<uInt>(end - it);
    strm.next_in = const_cast<uint8_t *>(&*it);

    uint8_t out[CHUNK];

    do {

        strm.avail_out = CHUNK;
        strm.next_out = out;

        ret = inflate(&strm, Z_NO_FLUSH);

        switch (ret) {
            case Z_NEED_DICT:
                ret = Z_DATA_ERROR;
                /* fall through */
            case Z_STREAM_ERROR:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
                inflateEnd(&strm);
                zerr(ret);
                return ERR;
            case Z_BUF_ERROR:
                //
                // input ran out before the end of the stream
                //
                inflateEnd(&strm);
                LOGE("zlibInflate: truncated stream");
                return ERR;
            default:
                break;
        }

        have = CHUNK - strm.avail_out;
        acc.insert(acc.end(), out, out + have);

    } while (ret != Z_STREAM_END);

    it += static_cast<std::ptrdiff_t>(strm.total_in);

    inflateEnd(&strm);

    return OK;
}


void zerr(int ret) {

    switch (ret) {
    case Z_ERRNO:
        LOGE("zlibInflate: Z_ERRNO");
        break;
    case Z_STREAM_ERROR:
        LOGE("zlibInflate: Z_STREAM_ERROR");
        break;
    case Z_DATA_ERROR:
        LOGE("zlibInflate: Z_DATA_ERROR");
        break;
    case Z_MEM_ERROR:
        LOGE("zlibInflate: Z_MEM_ERROR");
        break;
    case Z_VERSION_ERROR:
        LOGE("zlibInflate: Z_VERSION_ERROR");
        break;
    default:
        LOGE("zlibInflate: unhandled err: %d", ret);
        break;
    }
}


std::string hexPreview(
    std::vector<uint8_t>::const_iterator first,
    std::vector<uint8_t>::const_iterator last,
    size_t maxBytes) {

    std::string acc;

    char buf[4];

    size_t count = 0;

    for (auto it = first; it != last; it++) {

        if (count == maxBytes) {

            if (!acc.empty()) {
                acc += ' ';
            }

            acc += "...";

            break;
        }

        if (count != 0) {
            acc += ' ';
        }

        snprintf(buf, sizeof(buf), "%02x", static_cast<unsigned>(*it));

        acc += buf;

        count++;
    }

    return acc;
}
