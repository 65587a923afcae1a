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

#ifndef BASE_WINDOWINFO_H_
#define BASE_WINDOWINFO_H_

#include <memory>
#include <string>
#include <sys/types.h>
#include <pbnjson.hpp>

using namespace std;
using namespace pbnjson;

typedef unsigned long WindowHandle;

class WindowInfo;

typedef shared_ptr<const WindowInfo> WindowInfoPtr;

// Snapshot of one top-level OS window
class WindowInfo {
public:
    // handle 0 stands for a window that could not be found
    static WindowInfoPtr createPlaceholder(const string& title);

    WindowInfo(WindowHandle handle, const string& title, pid_t pid, const string& windowClass, long long creationTime = 0);
    virtual ~WindowInfo();

    JValue toJson() const;

    bool isPlaceholder() const
    {
        return m_handle == 0;
    }

    WindowHandle getHandle() const
    {
        return m_handle;
    }

    const string& getTitle() const
    {
        return m_title;
    }

    pid_t getPid() const
    {
        return m_pid;
    }

    const string& getWindowClass() const
    {
        return m_windowClass;
    }

    // Monotonic milliseconds. 0 when unknown.
    long long getCreationTime() const
    {
        return m_creationTime;
    }

private:
    WindowHandle m_handle;
    string m_title;
    pid_t m_pid;
    string m_windowClass;
    long long m_creationTime;

};

#endif /* BASE_WINDOWINFO_H_ */
