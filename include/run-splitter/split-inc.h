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

#include <optional>
#include <iterator>
#include <utility>
#include <cstdint>
#include <cstddef> // for size_t


enum split_mode : uint8_t {
    MODE_BEFORE = 0,
    MODE_AFTER = 1,
};


//
// A contiguous, non-empty sub-range [first, last) of the sequence being split.
//
// Borrows from the source sequence, so it is valid for as long as the source is,
// independent of the split_inc that produced it.
//
template <typename It>
struct split_run {

    It first;
    It last;

    It begin() const {
        return first;
    }

    It end() const {
        return last;
    }

    size_t size() const {
        return static_cast<size_t>(std::distance(first, last));
    }

    bool empty() const {
        return first == last;
    }
};


//
// Lazily splits [first, last) into runs delimited by elements matching a predicate.
//
// MODE_BEFORE: a matched element opens the following run.
// MODE_AFTER: a matched element closes the current run.
//
// Every element lands in exactly one run, runs come out in order and are never empty.
//
// In MODE_BEFORE, a match at the first position of a run is not a boundary unless it is
// also the final element:
//   [0, 1, 2] split before 0 -> [0, 1, 2]
//
// Single consumer only: the predicate is stored by value and may carry mutable state,
// nothing here synchronizes around it.
//
template <typename It, typename Pred>
class split_inc {
private:

    It cursor;
    It last;

    Pred matcher;

    split_mode mode;

    std::optional<split_run<It> > nextBefore();
    std::optional<split_run<It> > nextAfter();

public:

    split_inc(It firstIn, It lastIn, Pred matcherIn, split_mode modeIn);

    //
    // returns std::nullopt once exhausted, and on every call after that
    //
    std::optional<split_run<It> > next();

    bool done() const;
};


template <typename It, typename Pred>
split_inc<It, Pred>::split_inc(It firstIn, It lastIn, Pred matcherIn, split_mode modeIn) :
    cursor(firstIn), last(lastIn), matcher(std::move(matcherIn)), mode(modeIn) {}


template <typename It, typename Pred>
std::optional<split_run<It> > split_inc<It, Pred>::next() {

    switch (mode) {
    case MODE_BEFORE:
        return nextBefore();
    case MODE_AFTER:
        return nextAfter();
    default:
        cursor = last;
        return std::nullopt;
    }
}


template <typename It, typename Pred>
bool split_inc<It, Pred>::done() const {
    return cursor == last;
}


template <typename It, typename Pred>
std::optional<split_run<It> > split_inc<It, Pred>::nextBefore() {

    if (cursor == last) {
        return std::nullopt;
    }

    It start = cursor;

    for (It i = start; i != last; ++i) {

        It following = std::next(i);

        if (matcher(*i)) {

            if (i == start) {

                //
                // nothing buffered before the match yet, so keep going
                //
                if (following != last) {
                    continue;
                }

                cursor = last;

                return split_run<It>{ start, last };
            }

            cursor = i;

            return split_run<It>{ start, i };
        }

        if (following == last) {

            cursor = last;

            return split_run<It>{ start, last };
        }
    }

    return std::nullopt;
}


template <typename It, typename Pred>
std::optional<split_run<It> > split_inc<It, Pred>::nextAfter() {

    if (cursor == last) {
        return std::nullopt;
    }

    It start = cursor;

    for (It i = start; i != last; ++i) {

        It following = std::next(i);

        if (matcher(*i)) {

            cursor = following;

            return split_run<It>{ start, following };
        }

        if (following == last) {

            cursor = last;

            return split_run<It>{ start, last };
        }
    }

    return std::nullopt;
}


template <typename It, typename Pred>
split_inc<It, Pred> splitWithMode(It first, It last, Pred pred, split_mode mode) {
    return split_inc<It, Pred>(first, last, std::move(pred), mode);
}


template <typename It, typename Pred>
split_inc<It, Pred> splitBefore(It first, It last, Pred pred) {
    return splitWithMode(first, last, std::move(pred), MODE_BEFORE);
}


template <typename It, typename Pred>
split_inc<It, Pred> splitAfter(It first, It last, Pred pred) {
    return splitWithMode(first, last, std::move(pred), MODE_AFTER);
}


//
// c must outlive the returned split_inc and every run it produces
//
template <typename C, typename Pred>
split_inc<typename C::const_iterator, Pred> splitBefore(const C &c, Pred pred) {
    return splitBefore(c.cbegin(), c.cend(), std::move(pred));
}


template <typename C, typename Pred>
split_inc<typename C::const_iterator, Pred> splitAfter(const C &c, Pred pred) {
    return splitAfter(c.cbegin(), c.cend(), std::move(pred));
}


//
// a temporary container would be gone before the first run is produced
//
template <typename C, typename Pred>
void splitBefore(const C &&c, Pred pred) = delete;


template <typename C, typename Pred>
void splitAfter(const C &&c, Pred pred) = delete;
