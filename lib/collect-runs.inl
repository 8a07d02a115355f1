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


//
// Drive a split to exhaustion, copying each run into a new Oc::value_type appended to dest.
//
template <typename It, typename Oc, typename Pred>
void collectRuns(It it, It end_it, Oc &dest, Pred f, split_mode mode) {
    using RunContainer = typename Oc::value_type;

    auto s = splitWithMode(it, end_it, f, mode);

    while (auto run = s.next()) {
        dest.push_back(RunContainer(run->begin(), run->end()));
    }
}


template <typename It, typename Oc, typename Pred>
void splitBeforeInto(It it, It end_it, Oc &dest, Pred f) {
    collectRuns(it, end_it, dest, f, MODE_BEFORE);
}


template <typename It, typename Oc, typename Pred>
void splitAfterInto(It it, It end_it, Oc &dest, Pred f) {
    collectRuns(it, end_it, dest, f, MODE_AFTER);
}
