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

#include "lifecycle/launcher/AndroidArguments.h"

#include <ctype.h>
#include <regex>
#include <stdlib.h>

bool AndroidArguments::isValidPackageName(const string& packageName)
{
    static const regex PACKAGE_NAME("^[A-Za-z][A-Za-z0-9_]*(\\.[A-Za-z][A-Za-z0-9_]*)+$");
    return regex_match(packageName, PACKAGE_NAME);
}

bool AndroidArguments::toBool(const string& value, bool defaultValue)
{
    string lower;
    for (char c : value) {
        lower += (char) tolower((unsigned char) c);
    }

    if (lower == "true" || lower == "1" || lower == "yes")
        return true;
    if (lower == "false" || lower == "0" || lower == "no")
        return false;
    return defaultValue;
}

AndroidArguments::AndroidArguments()
    : m_launchTimeout(0),
      m_waitForWindow(true),
      m_virtualFallback(true)
{
}

AndroidArguments::~AndroidArguments()
{
}

void AndroidArguments::parse(const string& arguments)
{
    static const regex OPTION("--([A-Za-z0-9_]+)=(?:'([^']*)'|\"([^\"]*)\"|(\\S+))");

    for (sregex_iterator it(arguments.begin(), arguments.end(), OPTION), end; it != end; ++it) {
        const smatch& match = *it;
        string key = match[1].str();
        string value;
        if (match[2].matched)
            value = match[2].str();
        else if (match[3].matched)
            value = match[3].str();
        else
            value = match[4].str();

        if (key == "window_name") {
            m_windowName = value;
        } else if (key == "activity_name") {
            m_activityName = value;
        } else if (key == "launch_timeout") {
            int timeout = atoi(value.c_str());
            m_launchTimeout = timeout > 0 ? timeout : 0;
        } else if (key == "wait_for_window") {
            m_waitForWindow = toBool(value, true);
        } else if (key == "virtual_fallback") {
            m_virtualFallback = toBool(value, true);
        } else {
            m_customParameters[key] = value;
        }
    }
}
