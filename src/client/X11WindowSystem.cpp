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

#include "client/X11WindowSystem.h"

#include <string.h>

#include "util/Logger.h"

// Xlib macros (None, Status, Bool) must come after every other header
#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>

static int onXError(Display* display, XErrorEvent* event)
{
    // Windows can disappear between listing and querying them. BadWindow is expected.
    char text[256] = { 0 };
    XGetErrorText(display, event->error_code, text, sizeof(text));
    Logger::debug("X11WindowSystem", __FUNCTION__, Logger::format("0x%lx", event->resourceid), text);
    return 0;
}

X11WindowSystem::X11WindowSystem()
    : m_display(nullptr),
      m_root(0),
      m_netClientList(None),
      m_netActiveWindow(None),
      m_netCloseWindow(None),
      m_netWmName(None),
      m_netWmPid(None),
      m_netWmState(None),
      m_netWmStateHidden(None),
      m_utf8String(None)
{
    setClassName("X11WindowSystem");
}

X11WindowSystem::~X11WindowSystem()
{
    close();
}

bool X11WindowSystem::open(const string& displayName)
{
    lock_guard<mutex> lock(m_mutex);
    if (m_display)
        return true;

    m_display = XOpenDisplay(displayName.empty() ? NULL : displayName.c_str());
    if (!m_display) {
        Logger::warning(getClassName(), __FUNCTION__, displayName, "Cannot open display. Window operations are disabled");
        return false;
    }
    XSetErrorHandler(onXError);

    m_root = DefaultRootWindow(m_display);
    m_netClientList = XInternAtom(m_display, "_NET_CLIENT_LIST", False);
    m_netActiveWindow = XInternAtom(m_display, "_NET_ACTIVE_WINDOW", False);
    m_netCloseWindow = XInternAtom(m_display, "_NET_CLOSE_WINDOW", False);
    m_netWmName = XInternAtom(m_display, "_NET_WM_NAME", False);
    m_netWmPid = XInternAtom(m_display, "_NET_WM_PID", False);
    m_netWmState = XInternAtom(m_display, "_NET_WM_STATE", False);
    m_netWmStateHidden = XInternAtom(m_display, "_NET_WM_STATE_HIDDEN", False);
    m_utf8String = XInternAtom(m_display, "UTF8_STRING", False);

    Logger::info(getClassName(), __FUNCTION__, DisplayString(m_display), "Opened");
    return true;
}

void X11WindowSystem::close()
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display)
        return;
    XCloseDisplay(m_display);
    m_display = nullptr;
}

vector<WindowInfoPtr> X11WindowSystem::listWindows()
{
    vector<WindowInfoPtr> windows;
    lock_guard<mutex> lock(m_mutex);
    if (!m_display)
        return windows;

    for (XWindow window : getClientList()) {
        windows.push_back(make_shared<WindowInfo>(window, getTitle(window), getPid(window), getWindowClass(window)));
    }
    return windows;
}

bool X11WindowSystem::isWindow(WindowHandle handle)
{
    if (handle == 0)
        return false;

    lock_guard<mutex> lock(m_mutex);
    if (!m_display)
        return false;

    for (XWindow window : getClientList()) {
        if (window == handle)
            return true;
    }
    return false;
}

bool X11WindowSystem::activate(WindowHandle handle)
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display || handle == 0)
        return false;

    XMapRaised(m_display, handle);
    // source indication 2: request comes from a pager
    if (!sendMessage(handle, m_netActiveWindow, 2, CurrentTime, 0))
        return false;
    XFlush(m_display);
    return true;
}

bool X11WindowSystem::minimize(WindowHandle handle)
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display || handle == 0)
        return false;

    if (!XIconifyWindow(m_display, handle, DefaultScreen(m_display))) {
        Logger::warning(getClassName(), __FUNCTION__, Logger::format("0x%lx", handle), "XIconifyWindow failed");
        return false;
    }
    XFlush(m_display);
    return true;
}

bool X11WindowSystem::restore(WindowHandle handle)
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display || handle == 0)
        return false;

    XMapRaised(m_display, handle);
    bool result = sendMessage(handle, m_netActiveWindow, 2, CurrentTime, 0);
    XFlush(m_display);
    return result;
}

bool X11WindowSystem::close(WindowHandle handle)
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display || handle == 0)
        return false;

    bool result = sendMessage(handle, m_netCloseWindow, CurrentTime, 2, 0);
    XFlush(m_display);
    return result;
}

WindowHandle X11WindowSystem::getActiveWindow()
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display)
        return 0;

    unsigned char* data = nullptr;
    unsigned long count = 0;
    if (!getWindowProperty(m_root, m_netActiveWindow, XA_WINDOW, &data, &count))
        return 0;

    WindowHandle handle = count > 0 ? ((Window*) data)[0] : 0;
    XFree(data);
    return handle;
}

bool X11WindowSystem::isMinimized(WindowHandle handle)
{
    lock_guard<mutex> lock(m_mutex);
    if (!m_display || handle == 0)
        return false;
    return hasState(handle, m_netWmStateHidden);
}

vector<X11WindowSystem::XWindow> X11WindowSystem::getClientList()
{
    vector<XWindow> windows;
    unsigned char* data = nullptr;
    unsigned long count = 0;
    if (!getWindowProperty(m_root, m_netClientList, XA_WINDOW, &data, &count)) {
        Logger::debug(getClassName(), __FUNCTION__, "_NET_CLIENT_LIST is not available");
        return windows;
    }

    Window* list = (Window*) data;
    for (unsigned long i = 0; i < count; ++i) {
        windows.push_back(list[i]);
    }
    XFree(data);
    return windows;
}

bool X11WindowSystem::getWindowProperty(XWindow window, XAtom property, XAtom type, unsigned char** data, unsigned long* count)
{
    Atom actualType = None;
    int actualFormat = 0;
    unsigned long bytesAfter = 0;

    *data = nullptr;
    *count = 0;
    int status = XGetWindowProperty(m_display, window, property, 0, (~0L), False, type,
                                    &actualType, &actualFormat, count, &bytesAfter, data);
    if (status != Success || actualType == None) {
        if (*data)
            XFree(*data);
        *data = nullptr;
        *count = 0;
        return false;
    }
    return true;
}

string X11WindowSystem::getTitle(XWindow window)
{
    string title;
    unsigned char* data = nullptr;
    unsigned long count = 0;
    if (getWindowProperty(window, m_netWmName, m_utf8String, &data, &count) && count > 0) {
        title.assign((const char*) data, count);
        XFree(data);
        return title;
    }

    char* name = nullptr;
    if (XFetchName(m_display, window, &name) && name) {
        title = name;
        XFree(name);
    }
    return title;
}

string X11WindowSystem::getWindowClass(XWindow window)
{
    string windowClass;
    XClassHint hint;
    hint.res_name = nullptr;
    hint.res_class = nullptr;
    if (XGetClassHint(m_display, window, &hint)) {
        if (hint.res_class)
            windowClass = hint.res_class;
        else if (hint.res_name)
            windowClass = hint.res_name;
        if (hint.res_name)
            XFree(hint.res_name);
        if (hint.res_class)
            XFree(hint.res_class);
    }
    return windowClass;
}

pid_t X11WindowSystem::getPid(XWindow window)
{
    unsigned char* data = nullptr;
    unsigned long count = 0;
    if (!getWindowProperty(window, m_netWmPid, XA_CARDINAL, &data, &count))
        return 0;

    // 32-bit properties are returned as long
    pid_t pid = count > 0 ? (pid_t) ((unsigned long*) data)[0] : 0;
    XFree(data);
    return pid;
}

bool X11WindowSystem::hasState(XWindow window, XAtom state)
{
    unsigned char* data = nullptr;
    unsigned long count = 0;
    if (!getWindowProperty(window, m_netWmState, XA_ATOM, &data, &count))
        return false;

    bool found = false;
    Atom* atoms = (Atom*) data;
    for (unsigned long i = 0; i < count; ++i) {
        if (atoms[i] == state) {
            found = true;
            break;
        }
    }
    XFree(data);
    return found;
}

bool X11WindowSystem::sendMessage(XWindow window, XAtom type, long data0, long data1, long data2)
{
    XEvent event;
    memset(&event, 0, sizeof(event));
    event.xclient.type = ClientMessage;
    event.xclient.serial = 0;
    event.xclient.send_event = True;
    event.xclient.message_type = type;
    event.xclient.window = window;
    event.xclient.format = 32;
    event.xclient.data.l[0] = data0;
    event.xclient.data.l[1] = data1;
    event.xclient.data.l[2] = data2;

    Status status = XSendEvent(m_display, m_root, False, SubstructureRedirectMask | SubstructureNotifyMask, &event);
    if (status == 0) {
        Logger::warning(getClassName(), __FUNCTION__, Logger::format("0x%lx", window), "XSendEvent failed");
        return false;
    }
    return true;
}
