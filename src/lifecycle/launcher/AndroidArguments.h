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

#ifndef LIFECYCLE_LAUNCHER_ANDROIDARGUMENTS_H_
#define LIFECYCLE_LAUNCHER_ANDROIDARGUMENTS_H_

#include <map>
#include <string>

using namespace std;

// Launch options of an Android application, written as
// --window_name='Title' --activity_name=.MainActivity --launch_timeout=10
class AndroidArguments {
public:
    // Two or more dot separated segments. Each starts with a letter and holds letters, digits or '_'.
    static bool isValidPackageName(const string& packageName);

    AndroidArguments();
    virtual ~AndroidArguments();

    // Unknown keys are kept in getCustomParameters(). Malformed tokens are skipped.
    void parse(const string& arguments);

    const string& getWindowName() const
    {
        return m_windowName;
    }

    const string& getActivityName() const
    {
        return m_activityName;
    }

    // Seconds. 0 when not given.
    int getLaunchTimeout() const
    {
        return m_launchTimeout;
    }

    bool isWaitForWindow() const
    {
        return m_waitForWindow;
    }

    bool isVirtualFallback() const
    {
        return m_virtualFallback;
    }

    const map<string, string>& getCustomParameters() const
    {
        return m_customParameters;
    }

private:
    static bool toBool(const string& value, bool defaultValue);

    string m_windowName;
    string m_activityName;
    int m_launchTimeout;
    bool m_waitForWindow;
    bool m_virtualFallback;
    map<string, string> m_customParameters;

};

#endif /* LIFECYCLE_LAUNCHER_ANDROIDARGUMENTS_H_ */
