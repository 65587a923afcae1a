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

#ifndef LIFECYCLE_WINDOWMANAGER_H_
#define LIFECYCLE_WINDOWMANAGER_H_

#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <vector>
#include <boost/signals2.hpp>

#include "base/WindowInfo.h"
#include "client/AbsWindowSystem.h"
#include "interface/IClassName.h"

using namespace std;

// Window queries and commands on top of AbsWindowSystem.
//
// The window system does not always report when a window was created.
// Then the first time a window is listed counts as its creation time.
// Windows already present at initialize() get 0 (unknown) and never
// take part in correlation.
class WindowManager : public IClassName {
public:
    WindowManager(AbsWindowSystem& windowSystem);
    virtual ~WindowManager();

    // Takes the baseline of already existing windows
    void initialize();

    void setCacheTtl(long long cacheTtl)
    {
        m_cacheTtl = cacheTtl;
    }
    void setCorrelationWindow(long long correlationWindow)
    {
        m_correlationWindow = correlationWindow;
    }

    vector<WindowInfoPtr> getWindows();
    vector<WindowInfoPtr> findWindowsByClass(const string& windowClass);
    WindowInfoPtr findWindowByTitle(const string& title, bool exact = false);

    // Window owned by pid. A title containing expectedTitle wins over the others.
    WindowInfoPtr findMainWindow(pid_t pid, const string& expectedTitle = "");

    // Correlation for launches that do not report their process.
    // Successful results are cached per cacheKey until the cache is invalidated or expires.
    WindowInfoPtr findAmbiguousWindow(const string& cacheKey, const string& windowClass,
                                      const string& titleHint, bool exactTitle, long long launchTime);

    bool isWindowValid(WindowHandle handle);
    bool isWindowActive(WindowHandle handle);
    bool isMinimized(WindowHandle handle);
    WindowHandle getActiveWindow();

    bool switchToWindow(WindowHandle handle);
    bool minimize(WindowHandle handle);
    bool restore(WindowHandle handle);
    bool close(WindowHandle handle);

    void invalidateCache();

    // Raised when the window list or a window state changed
    boost::signals2::signal<void()> EventWindowChanged;

private:
    struct CacheEntry {
        WindowInfoPtr window;
        long long expiry;
    };

    void notifyChanged();

    AbsWindowSystem& m_windowSystem;

    long long m_cacheTtl;
    long long m_correlationWindow;

    mutex m_mutex;
    bool m_isInitialized;
    // handle ==> first seen (monotonic ms, 0 for baseline windows)
    map<WindowHandle, long long> m_firstSeen;
    map<string, CacheEntry> m_cache;

};

#endif /* LIFECYCLE_WINDOWMANAGER_H_ */
