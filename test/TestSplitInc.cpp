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

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <forward_list>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <cstdint>

#include "collect-runs.inl"


class SplitIncTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {}

    static void TearDownTestSuite() {}

    void SetUp() override {}

    void TearDown() override {}
};


//
// true when splitBefore / splitAfter accept a C as the container argument
//
using byte_pred = bool (*)(uint8_t);

template <typename C, typename = void>
struct can_split_before : std::false_type {};

template <typename C>
struct can_split_before<C, std::void_t<decltype(splitBefore(std::declval<C>(), std::declval<byte_pred>()))> > : std::true_type {};

template <typename C, typename = void>
struct can_split_after : std::false_type {};

template <typename C>
struct can_split_after<C, std::void_t<decltype(splitAfter(std::declval<C>(), std::declval<byte_pred>()))> > : std::true_type {};

static_assert(can_split_before<std::vector<uint8_t> &>::value, "lvalue container must be accepted");
static_assert(can_split_before<const std::vector<uint8_t> &>::value, "const lvalue container must be accepted");
static_assert(!can_split_before<std::vector<uint8_t> >::value, "temporary container must be rejected");
static_assert(!can_split_before<const std::vector<uint8_t> >::value, "const temporary container must be rejected");

static_assert(can_split_after<std::vector<uint8_t> &>::value, "lvalue container must be accepted");
static_assert(can_split_after<const std::vector<uint8_t> &>::value, "const lvalue container must be accepted");
static_assert(!can_split_after<std::vector<uint8_t> >::value, "temporary container must be rejected");
static_assert(!can_split_after<const std::vector<uint8_t> >::value, "const temporary container must be rejected");


template <typename It>
std::vector<uint8_t> toVector(const std::optional<split_run<It> > &run) {
    return std::vector<uint8_t>(run->begin(), run->end());
}


TEST_F(SplitIncTest, splitBefore1) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitBefore(a, [](uint8_t v) { return v == 1; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(1, 2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitAfter1) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitAfter(a, [](uint8_t v) { return v == 1; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitBefore2) {

    std::vector<uint8_t> a{0, 1, 2, 3, 4, 5, 6, 7, 8};

    auto s = splitBefore(a.cbegin(), a.cend(), [](uint8_t v) { return v == 2 || v == 5; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(2, 3, 4));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(5, 6, 7, 8));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitAfter2) {

    std::vector<uint8_t> a{0, 1, 2, 3, 4, 5, 6, 7, 8};

    auto s = splitAfter(a.cbegin(), a.cend(), [](uint8_t v) { return v == 2 || v == 5; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1, 2));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(3, 4, 5));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(6, 7, 8));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitBeforeStart) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitBefore(a, [](uint8_t v) { return v == 0; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1, 2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitAfterStart) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitAfter(a, [](uint8_t v) { return v == 0; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(1, 2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitBeforeNoMatch) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitBefore(a, [](uint8_t v) { return v == 12; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1, 2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitAfterNoMatch) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitAfter(a, [](uint8_t v) { return v == 12; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1, 2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitBeforeEnd) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitBefore(a, [](uint8_t v) { return v == 2; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1));

    run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(2));

    EXPECT_FALSE(s.next());
}

TEST_F(SplitIncTest, splitAfterEnd) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitAfter(a, [](uint8_t v) { return v == 2; });

    auto run = s.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(0, 1, 2));

    EXPECT_FALSE(s.next());
}

//
// match at 0 is absorbed, match at 3 still opens a run
//
TEST_F(SplitIncTest, splitBeforeStartAndMiddle) {

    std::vector<uint8_t> a{0, 1, 2, 3, 4, 5};

    std::vector<std::vector<uint8_t> > dest;

    splitBeforeInto(a.cbegin(), a.cend(), dest, [](uint8_t v) { return v == 0 || v == 3; });

    EXPECT_THAT(dest, testing::ElementsAre(
                          testing::ElementsAre(0, 1, 2),
                          testing::ElementsAre(3, 4, 5)));
}

TEST_F(SplitIncTest, everyElementMatches) {

    std::vector<uint8_t> a{7, 7, 7};

    std::vector<std::vector<uint8_t> > before;

    splitBeforeInto(a.cbegin(), a.cend(), before, [](uint8_t) { return true; });

    EXPECT_THAT(before, testing::ElementsAre(
                            testing::ElementsAre(7),
                            testing::ElementsAre(7),
                            testing::ElementsAre(7)));

    std::vector<std::vector<uint8_t> > after;

    splitAfterInto(a.cbegin(), a.cend(), after, [](uint8_t) { return true; });

    EXPECT_THAT(after, testing::ElementsAre(
                           testing::ElementsAre(7),
                           testing::ElementsAre(7),
                           testing::ElementsAre(7)));
}

TEST_F(SplitIncTest, singleElement) {

    std::vector<uint8_t> a{9};

    auto before = splitBefore(a, [](uint8_t v) { return v == 9; });

    auto run = before.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(9));
    EXPECT_FALSE(before.next());

    auto after = splitAfter(a, [](uint8_t v) { return v == 9; });

    run = after.next();

    ASSERT_TRUE(run);
    EXPECT_THAT(toVector(run), testing::ElementsAre(9));
    EXPECT_FALSE(after.next());
}

TEST_F(SplitIncTest, emptySource) {

    std::vector<uint8_t> a;

    int calls = 0;

    auto before = splitBefore(a, [&calls](uint8_t) { calls++; return true; });

    EXPECT_TRUE(before.done());
    EXPECT_FALSE(before.next());

    auto after = splitAfter(a, [&calls](uint8_t) { calls++; return true; });

    EXPECT_TRUE(after.done());
    EXPECT_FALSE(after.next());

    EXPECT_EQ(calls, 0);
}

TEST_F(SplitIncTest, exhaustedStaysExhausted) {

    std::vector<uint8_t> a{0, 1, 2};

    auto s = splitAfter(a, [](uint8_t v) { return v == 1; });

    EXPECT_FALSE(s.done());

    EXPECT_TRUE(s.next());
    EXPECT_TRUE(s.next());

    EXPECT_TRUE(s.done());

    for (int i = 0; i < 5; i++) {
        EXPECT_FALSE(s.next());
    }

    EXPECT_TRUE(s.done());
}

TEST_F(SplitIncTest, constructionDoesNotEvaluate) {

    std::vector<uint8_t> a{0, 1, 2};

    int calls = 0;

    auto s = splitBefore(a, [&calls](uint8_t) { calls++; return false; });

    EXPECT_EQ(calls, 0);

    EXPECT_TRUE(s.next());

    EXPECT_EQ(calls, 3);
}

//
// after: each element once
// before: each element once, plus once more for each element that opens a run
//
TEST_F(SplitIncTest, predicateEvaluationCount) {

    std::vector<uint8_t> a{0, 1, 2, 3, 4, 5, 6, 7, 8};

    std::vector<uint8_t> seen;

    auto after = splitAfter(a, [&seen](uint8_t v) { seen.push_back(v); return v == 2 || v == 5; });

    while (after.next()) {}

    EXPECT_THAT(seen, testing::ElementsAre(0, 1, 2, 3, 4, 5, 6, 7, 8));

    seen.clear();

    auto before = splitBefore(a, [&seen](uint8_t v) { seen.push_back(v); return v == 2 || v == 5; });

    while (before.next()) {}

    EXPECT_THAT(seen, testing::ElementsAre(0, 1, 2, 2, 3, 4, 5, 5, 6, 7, 8));
}

TEST_F(SplitIncTest, statefulPredicate) {

    std::vector<uint8_t> a{10, 11, 12, 13, 14, 15, 16};

    std::vector<std::vector<uint8_t> > dest;

    //
    // matches every third call
    //
    int count = 0;

    splitAfterInto(a.cbegin(), a.cend(), dest, [count](uint8_t) mutable { return ++count % 3 == 0; });

    EXPECT_THAT(dest, testing::ElementsAre(
                          testing::ElementsAre(10, 11, 12),
                          testing::ElementsAre(13, 14, 15),
                          testing::ElementsAre(16)));
}

TEST_F(SplitIncTest, forwardIterators) {

    std::forward_list<int> l{1, 0, 2, 0, 3};

    auto s = splitAfter(l.cbegin(), l.cend(), [](int v) { return v == 0; });

    std::vector<std::vector<int> > dest;

    while (auto run = s.next()) {
        EXPECT_FALSE(run->empty());
        dest.push_back(std::vector<int>(run->begin(), run->end()));
    }

    EXPECT_THAT(dest, testing::ElementsAre(
                          testing::ElementsAre(1, 0),
                          testing::ElementsAre(2, 0),
                          testing::ElementsAre(3)));
}

TEST_F(SplitIncTest, forwardIteratorsBefore) {

    std::forward_list<int> l{1, 0, 2, 0, 3};

    auto s = splitBefore(l.cbegin(), l.cend(), [](int v) { return v == 0; });

    std::vector<std::vector<int> > dest;

    while (auto run = s.next()) {
        EXPECT_FALSE(run->empty());
        dest.push_back(std::vector<int>(run->begin(), run->end()));
    }

    EXPECT_THAT(dest, testing::ElementsAre(
                          testing::ElementsAre(1),
                          testing::ElementsAre(0, 2),
                          testing::ElementsAre(0, 3)));

    //
    // match on the final element
    //
    std::forward_list<int> tail{1, 2, 0};

    auto t = splitBefore(tail.cbegin(), tail.cend(), [](int v) { return v == 0; });

    dest.clear();

    while (auto run = t.next()) {
        dest.push_back(std::vector<int>(run->begin(), run->end()));
    }

    EXPECT_THAT(dest, testing::ElementsAre(
                          testing::ElementsAre(1, 2),
                          testing::ElementsAre(0)));

    EXPECT_TRUE(t.done());
}

TEST_F(SplitIncTest, unknownModeIsExhausted) {

    std::vector<uint8_t> a{0, 1, 2};

    int calls = 0;

    auto s = splitWithMode(a.cbegin(), a.cend(), [&calls](uint8_t) { calls++; return true; }, static_cast<split_mode>(7));

    EXPECT_FALSE(s.done());

    EXPECT_FALSE(s.next());

    EXPECT_TRUE(s.done());

    EXPECT_FALSE(s.next());

    EXPECT_EQ(calls, 0);
}

TEST_F(SplitIncTest, runsBorrowSource) {

    std::string text = "ab,cd,ef";

    auto s = splitBefore(text, [](char c) { return c == ','; });

    auto first = s.next();
    auto second = s.next();
    auto third = s.next();

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    ASSERT_TRUE(third);
    EXPECT_FALSE(s.next());

    EXPECT_EQ(first->begin(), text.cbegin());
    EXPECT_EQ(third->end(), text.cend());

    EXPECT_EQ(std::string(first->begin(), first->end()), "ab");
    EXPECT_EQ(std::string(second->begin(), second->end()), ",cd");
    EXPECT_EQ(std::string(third->begin(), third->end()), ",ef");

    EXPECT_EQ(second->size(), 3u);
}

//
// every 0/1 sequence up to length 8: runs are non-empty, in order, and cover the source exactly
//
TEST_F(SplitIncTest, partitionLaw) {

    for (size_t len = 0; len <= 8; len++) {

        for (uint32_t bits = 0; bits < (1u << len); bits++) {

            std::vector<uint8_t> a;

            for (size_t i = 0; i < len; i++) {
                a.push_back(static_cast<uint8_t>((bits >> i) & 1));
            }

            for (auto mode : { MODE_BEFORE, MODE_AFTER }) {

                auto s = splitWithMode(a.cbegin(), a.cend(), [](uint8_t v) { return v == 1; }, mode);

                auto expected = a.cbegin();

                std::vector<uint8_t> joined;

                while (auto run = s.next()) {

                    ASSERT_FALSE(run->empty());

                    ASSERT_EQ(run->begin(), expected);

                    expected = run->end();

                    joined.insert(joined.end(), run->begin(), run->end());
                }

                EXPECT_EQ(expected, a.cend());
                EXPECT_EQ(joined, a);
                EXPECT_FALSE(s.next());
            }
        }
    }
}
