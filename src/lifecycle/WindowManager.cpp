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

#include "lifecycle/WindowManager.h"

#include "lifecycle/WindowCorrelator.h"
#include "util/Logger.h"
#include "util/Time.h"

WindowManager::WindowManager(AbsWindowSystem& windowSystem)
    : m_windowSystem(windowSystem),
      m_cacheTtl(30000),
      m_correlationWindow(WindowCorrelator::DEFAULT_WINDOW),
      m_isInitialized(false)
{
    setClassName("WindowManager");
}

WindowManager::~WindowManager()
{
}

void WindowManager::initialize()
{
    vector<WindowInfoPtr> windows = m_windowSystem.listWindows();

    lock_guard<mutex> lock(m_mutex);
    m_firstSeen.clear();
    for (const WindowInfoPtr& window : windows) {
        m_firstSeen[window->getHandle()] = 0;
    }
    m_cache.clear();
    m_isInitialized = true;
    Logger::info(getClassName(), __FUNCTION__, Logger::format("Baseline windows(%d)", (int) windows.size()));
}

vector<WindowInfoPtr> WindowManager::getWindows()
{
    vector<WindowInfoPtr> listed = m_windowSystem.listWindows();
    vector<WindowInfoPtr> windows;
    bool changed = false;
    {
        lock_guard<mutex> lock(m_mutex);
        long long now = Time::getCurrentTime();

        set<WindowHandle> present;
        for (const WindowInfoPtr& window : listed) {
            if (!window || window->isPlaceholder())
                continue;
            present.insert(window->getHandle());

            auto it = m_firstSeen.find(window->getHandle());
            if (it == m_firstSeen.end()) {
                it = m_firstSeen.insert(make_pair(window->getHandle(), m_isInitialized ? now : 0)).first;
                changed = true;
            }

            if (window->getCreationTime() > 0) {
                windows.push_back(window);
            } else {
                windows.push_back(make_shared<WindowInfo>(window->getHandle(), window->getTitle(), window->getPid(),
                                                          window->getWindowClass(), it->second));
            }
        }

        for (auto it = m_firstSeen.begin(); it != m_firstSeen.end();) {
            if (present.find(it->first) == present.end()) {
                it = m_firstSeen.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
    }

    if (changed)
        notifyChanged();
    return windows;
}

vector<WindowInfoPtr> WindowManager::findWindowsByClass(const string& windowClass)
{
    vector<WindowInfoPtr> windows;
    for (const WindowInfoPtr& window : getWindows()) {
        if (WindowCorrelator::containsIgnoreCase(window->getWindowClass(), windowClass))
            windows.push_back(window);
    }
    return windows;
}

WindowInfoPtr WindowManager::findWindowByTitle(const string& title, bool exact)
{
    if (title.empty())
        return nullptr;

    for (const WindowInfoPtr& window : getWindows()) {
        if (exact && WindowCorrelator::equalsIgnoreCase(window->getTitle(), title))
            return window;
        if (!exact && WindowCorrelator::containsIgnoreCase(window->getTitle(), title))
            return window;
    }
    return nullptr;
}

WindowInfoPtr WindowManager::findMainWindow(pid_t pid, const string& expectedTitle)
{
    if (pid <= 0)
        return nullptr;

    WindowInfoPtr first = nullptr;
    for (const WindowInfoPtr& window : getWindows()) {
        if (window->getPid() != pid)
            continue;
        if (!expectedTitle.empty() && WindowCorrelator::containsIgnoreCase(window->getTitle(), expectedTitle))
            return window;
        if (!first)
            first = window;
    }
    return first;
}

WindowInfoPtr WindowManager::findAmbiguousWindow(const string& cacheKey, const string& windowClass,
                                                 const string& titleHint, bool exactTitle, long long launchTime)
{
    WindowInfoPtr cached = nullptr;
    {
        lock_guard<mutex> lock(m_mutex);
        auto it = m_cache.find(cacheKey);
        if (it != m_cache.end()) {
            if (it->second.expiry > Time::getCurrentTime())
                cached = it->second.window;
            else
                m_cache.erase(it);
        }
    }

    if (cached) {
        if (m_windowSystem.isWindow(cached->getHandle())) {
            Logger::debug(getClassName(), __FUNCTION__, cacheKey, "Cache hit");
            return cached;
        }
        lock_guard<mutex> lock(m_mutex);
        auto it = m_cache.find(cacheKey);
        if (it != m_cache.end() && it->second.window == cached)
            m_cache.erase(it);
    }

    vector<WindowInfoPtr> candidates = findWindowsByClass(windowClass);
    WindowInfoPtr window = WindowCorrelator::correlate(candidates, launchTime, titleHint, exactTitle, m_correlationWindow);
    if (!window) {
        Logger::debug(getClassName(), __FUNCTION__, cacheKey,
                      Logger::format("No match among %d '%s' windows", (int) candidates.size(), windowClass.c_str()));
        return nullptr;
    }

    lock_guard<mutex> lock(m_mutex);
    CacheEntry entry;
    entry.window = window;
    entry.expiry = Time::getCurrentTime() + m_cacheTtl;
    m_cache[cacheKey] = entry;
    Logger::info(getClassName(), __FUNCTION__, cacheKey,
                 Logger::format("Matched 0x%lx '%s'", window->getHandle(), window->getTitle().c_str()));
    return window;
}

bool WindowManager::isWindowValid(WindowHandle handle)
{
    if (handle == 0)
        return false;
    return m_windowSystem.isWindow(handle);
}

bool WindowManager::isWindowActive(WindowHandle handle)
{
    if (handle == 0)
        return false;
    return m_windowSystem.getActiveWindow() == handle;
}

bool WindowManager::isMinimized(WindowHandle handle)
{
    if (handle == 0)
        return false;
    return m_windowSystem.isMinimized(handle);
}

WindowHandle WindowManager::getActiveWindow()
{
    return m_windowSystem.getActiveWindow();
}

bool WindowManager::switchToWindow(WindowHandle handle)
{
    if (!isWindowValid(handle)) {
        Logger::warning(getClassName(), __FUNCTION__, Logger::format("0x%lx", handle), "Invalid window");
        return false;
    }

    if (m_windowSystem.isMinimized(handle) && !m_windowSystem.restore(handle))
        return false;
    if (!m_windowSystem.activate(handle))
        return false;

    notifyChanged();
    return true;
}

bool WindowManager::minimize(WindowHandle handle)
{
    if (!isWindowValid(handle) || !m_windowSystem.minimize(handle))
        return false;
    notifyChanged();
    return true;
}

bool WindowManager::restore(WindowHandle handle)
{
    if (!isWindowValid(handle) || !m_windowSystem.restore(handle))
        return false;
    notifyChanged();
    return true;
}

bool WindowManager::close(WindowHandle handle)
{
    if (!isWindowValid(handle) || !m_windowSystem.close(handle))
        return false;
    notifyChanged();
    return true;
}

void WindowManager::invalidateCache()
{
    lock_guard<mutex> lock(m_mutex);
    m_cache.clear();
}

void WindowManager::notifyChanged()
{
    invalidateCache();
    EventWindowChanged();
}
