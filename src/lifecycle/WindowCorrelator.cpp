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

#include "lifecycle/WindowCorrelator.h"

#include <algorithm>
#include <ctype.h>

static string toLower(const string& text)
{
    string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char) tolower(c); });
    return lower;
}

const long long WindowCorrelator::DEFAULT_WINDOW;

bool WindowCorrelator::containsIgnoreCase(const string& text, const string& pattern)
{
    if (pattern.empty())
        return false;
    return toLower(text).find(toLower(pattern)) != string::npos;
}

bool WindowCorrelator::equalsIgnoreCase(const string& a, const string& b)
{
    return a.size() == b.size() && toLower(a) == toLower(b);
}

WindowInfoPtr WindowCorrelator::correlate(const vector<WindowInfoPtr>& candidates,
                                          long long launchTime,
                                          const string& titleHint,
                                          bool exactTitle,
                                          long long window)
{
    vector<WindowInfoPtr> survivors;
    for (const WindowInfoPtr& candidate : candidates) {
        if (!candidate || candidate->isPlaceholder() || candidate->getCreationTime() <= 0)
            continue;
        long long offset = candidate->getCreationTime() - launchTime;
        if (offset < -window || offset > window)
            continue;
        survivors.push_back(candidate);
    }
    if (survivors.empty())
        return nullptr;

    std::stable_sort(survivors.begin(), survivors.end(), [](const WindowInfoPtr& a, const WindowInfoPtr& b) {
        return a->getCreationTime() < b->getCreationTime();
    });

    if (exactTitle) {
        for (const WindowInfoPtr& survivor : survivors) {
            if (equalsIgnoreCase(survivor->getTitle(), titleHint))
                return survivor;
        }
        return nullptr;
    }

    for (const WindowInfoPtr& survivor : survivors) {
        if (containsIgnoreCase(survivor->getTitle(), titleHint))
            return survivor;
    }
    return survivors.front();
}
