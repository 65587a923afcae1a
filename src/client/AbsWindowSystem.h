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

#ifndef CLIENT_ABSWINDOWSYSTEM_H_
#define CLIENT_ABSWINDOWSYSTEM_H_

#include <iostream>
#include <vector>

#include "base/WindowInfo.h"

using namespace std;

// Top-level windows of the desktop session.
// Implementations report creation time 0 when the OS does not expose it.
class AbsWindowSystem {
public:
    AbsWindowSystem() {};
    virtual ~AbsWindowSystem() {};

    virtual vector<WindowInfoPtr> listWindows() = 0;
    virtual bool isWindow(WindowHandle handle) = 0;

    virtual bool activate(WindowHandle handle) = 0;
    virtual bool minimize(WindowHandle handle) = 0;
    virtual bool restore(WindowHandle handle) = 0;
    virtual bool close(WindowHandle handle) = 0;

    // 0 when nothing has focus
    virtual WindowHandle getActiveWindow() = 0;
    virtual bool isMinimized(WindowHandle handle) = 0;

};

#endif /* CLIENT_ABSWINDOWSYSTEM_H_ */
