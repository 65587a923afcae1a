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

#ifndef LIFECYCLE_LAUNCHER_ANDROIDLAUNCHER_H_
#define LIFECYCLE_LAUNCHER_ANDROIDLAUNCHER_H_

#include <map>
#include <mutex>

#include "client/AbsAndroidSubsystem.h"
#include "interface/IWindowEventSource.h"
#include "lifecycle/WindowManager.h"
#include "lifecycle/launcher/AbsLauncher.h"
#include "lifecycle/launcher/AndroidArguments.h"
#include "util/Ticker.h"

// Android packages inside the compatibility subsystem.
// The subsystem does not report a process id, so instances have pid 0 and
// their windows are found heuristically. Watched windows are polled for
// focus and closure.
class AndroidLauncher : public AbsLauncher,
                        public IWindowEventSource {
public:
    AndroidLauncher(AbsAndroidSubsystem& subsystem, WindowManager& windowManager, guint watchInterval = 5000);
    virtual ~AndroidLauncher();

    virtual AppKind getSupportedKind() const override
    {
        return AppKind::AppKind_AndroidPackage;
    }

    virtual CorrelationMode getCorrelationMode() const override
    {
        return CorrelationMode::CorrelationMode_Heuristic;
    }

    virtual LaunchResult launch(const ApplicationDescriptor& descriptor, const string& principal) override;
    virtual CorrelationRequest getCorrelationRequest(const ApplicationDescriptor& descriptor) override;
    virtual bool relaunch(const ApplicationInstance& instance, string& errorText) override;
    // force-stop is the only way to end a package, so force changes nothing
    virtual bool terminate(const ApplicationInstance& instance, bool force, string& errorText) override;

    // IWindowEventSource
    virtual void watch(const string& instanceId, WindowInfoPtr window) override;
    virtual void unwatch(const string& instanceId) override;
    virtual void startWatching() override;
    virtual void stopWatching() override;

    // One liveness round over the watched windows
    void checkWindows();

private:
    struct WatchedWindow {
        WindowHandle handle;
        bool active;
    };

    AbsAndroidSubsystem& m_subsystem;
    WindowManager& m_windowManager;

    Ticker m_ticker;
    boost::signals2::scoped_connection m_tickConnection;

    mutex m_mutex;
    map<string, WatchedWindow> m_watched;

};

#endif /* LIFECYCLE_LAUNCHER_ANDROIDLAUNCHER_H_ */
