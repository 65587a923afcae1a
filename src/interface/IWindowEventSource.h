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

#ifndef INTERFACE_IWINDOWEVENTSOURCE_H_
#define INTERFACE_IWINDOWEVENTSOURCE_H_

#include <string>
#include <boost/signals2.hpp>

#include "base/WindowInfo.h"

using namespace std;

// Optional launcher capability. Launchers that watch their own windows
// report focus and closure per instance id.
class IWindowEventSource {
public:
    IWindowEventSource() {};
    virtual ~IWindowEventSource() {};

    virtual void watch(const string& instanceId, WindowInfoPtr window) = 0;
    virtual void unwatch(const string& instanceId) = 0;

    virtual void startWatching() = 0;
    virtual void stopWatching() = 0;

    boost::signals2::signal<void(const string& instanceId)> EventWindowActivated;
    boost::signals2::signal<void(const string& instanceId)> EventWindowClosed;

};

#endif /* INTERFACE_IWINDOWEVENTSOURCE_H_ */
