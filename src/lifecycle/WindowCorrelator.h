// Copyright (c) 2019-2026 LG Electronics, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// SPDX-License-Identifier: Apache-2.0

#ifndef LIFECYCLE_WINDOWCORRELATOR_H_
#define LIFECYCLE_WINDOWCORRELATOR_H_

#include <string>
#include <vector>

#include "base/WindowInfo.h"

using namespace std;

// Picks the window most likely opened by a launch that did not tell us its window.
//
// 1. Drop candidates created more than 'window' ms before or after launchTime.
//    Candidates with an unknown creation time are dropped too.
// 2. Prefer a title containing titleHint (case-insensitive).
//    With exactTitle the title must equal titleHint (case-insensitive) and step 3 is skipped.
// 3. Otherwise take the earliest survivor. Two launches of different apps inside
//    the same window can be confused here.
class WindowCorrelator {
public:
    static const long long DEFAULT_WINDOW = 30000;

    static WindowInfoPtr correlate(const vector<WindowInfoPtr>& candidates,
                                   long long launchTime,
                                   const string& titleHint,
                                   bool exactTitle = false,
                                   long long window = DEFAULT_WINDOW);

    static bool containsIgnoreCase(const string& text, const string& pattern);
    static bool equalsIgnoreCase(const string& a, const string& b);

private:
    WindowCorrelator() {};
    virtual ~WindowCorrelator() {};

};

#endif /* LIFECYCLE_WINDOWCORRELATOR_H_ */
