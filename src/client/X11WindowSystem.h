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

#ifndef CLIENT_X11WINDOWSYSTEM_H_
#define CLIENT_X11WINDOWSYSTEM_H_

#include <mutex>
#include <string>

#include "client/AbsWindowSystem.h"
#include "interface/IClassName.h"

// Xlib is included by the source file only
struct _XDisplay;

// EWMH client of the running X server (or XWayland).
// XInitThreads() must be called before the first instance is created.
class X11WindowSystem : public AbsWindowSystem,
                        public IClassName {
public:
    X11WindowSystem();
    virtual ~X11WindowSystem();

    bool open(const string& displayName = "");
    void close();

    bool isOpened()
    {
        lock_guard<mutex> lock(m_mutex);
        return m_display != nullptr;
    }

    virtual vector<WindowInfoPtr> listWindows() override;
    virtual bool isWindow(WindowHandle handle) override;

    virtual bool activate(WindowHandle handle) override;
    virtual bool minimize(WindowHandle handle) override;
    virtual bool restore(WindowHandle handle) override;
    virtual bool close(WindowHandle handle) override;

    virtual WindowHandle getActiveWindow() override;
    virtual bool isMinimized(WindowHandle handle) override;

private:
    typedef unsigned long XWindow;
    typedef unsigned long XAtom;

    X11WindowSystem(const X11WindowSystem&);
    X11WindowSystem& operator=(const X11WindowSystem&);

    // Callers hold m_mutex
    vector<XWindow> getClientList();
    bool getWindowProperty(XWindow window, XAtom property, XAtom type, unsigned char** data, unsigned long* count);
    string getTitle(XWindow window);
    string getWindowClass(XWindow window);
    pid_t getPid(XWindow window);
    bool hasState(XWindow window, XAtom state);
    bool sendMessage(XWindow window, XAtom type, long data0, long data1 = 0, long data2 = 0);

    mutex m_mutex;
    struct _XDisplay* m_display;
    XWindow m_root;

    XAtom m_netClientList;
    XAtom m_netActiveWindow;
    XAtom m_netCloseWindow;
    XAtom m_netWmName;
    XAtom m_netWmPid;
    XAtom m_netWmState;
    XAtom m_netWmStateHidden;
    XAtom m_utf8String;

};

#endif /* CLIENT_X11WINDOWSYSTEM_H_ */
