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

#ifndef LIFECYCLE_LAUNCHER_ABSLAUNCHER_H_
#define LIFECYCLE_LAUNCHER_ABSLAUNCHER_H_

#include <iostream>
#include <memory>
#include <stdint.h>
#include <vector>

#include "base/ApplicationDescriptor.h"
#include "base/ApplicationInstance.h"
#include "base/LaunchResult.h"
#include "interface/IClassName.h"

using namespace std;

enum class CorrelationMode : int8_t {
    CorrelationMode_None = 0,   // No window is looked up
    CorrelationMode_Process,    // Window owned by the launched pid
    CorrelationMode_Heuristic,  // Window class, title and creation time
};

// How the orchestrator should look for the window of a launch
struct CorrelationRequest {
    CorrelationRequest()
        : exactTitle(false),
          waitForWindow(true),
          searchTimeout(0),
          allowPlaceholder(true)
    {
    }

    string windowClass;
    string titleHint;
    bool exactTitle;
    bool waitForWindow;
    // 0 means the configured default
    long long searchTimeout;
    bool allowPlaceholder;
    string placeholderTitle;
};

class AbsLauncher : public IClassName {
public:
    static const char* toString(CorrelationMode mode);

    AbsLauncher() {};
    virtual ~AbsLauncher() {};

    virtual AppKind getSupportedKind() const = 0;
    virtual CorrelationMode getCorrelationMode() const = 0;

    virtual bool canLaunch(const ApplicationDescriptor& descriptor)
    {
        return descriptor.getKind() == getSupportedKind();
    }

    // Never throws by contract. The orchestrator still guards the call.
    virtual LaunchResult launch(const ApplicationDescriptor& descriptor, const string& principal) = 0;

    virtual CorrelationRequest getCorrelationRequest(const ApplicationDescriptor& descriptor)
    {
        CorrelationRequest request;
        request.titleHint = descriptor.getName();
        request.placeholderTitle = descriptor.getName();
        return request;
    }

    // Used by switchTo when there is no window to bring to front
    virtual bool relaunch(const ApplicationInstance& instance, string& errorText)
    {
        errorText = "Relaunch is not supported";
        return false;
    }

    // Stops an instance that has neither a process nor a real window to close.
    // Nothing is left to stop for the kinds that always own one.
    virtual bool terminate(const ApplicationInstance& instance, bool force, string& errorText)
    {
        return true;
    }

protected:
    // First program of candidates found in PATH (or executable as given)
    static string findFirstProgram(const vector<string>& candidates);

    // Spawns program in its own process group with the session environment,
    // LAM_APP_ID and LAM_INSTANCE_PRINCIPAL
    LaunchResult spawn(const string& program, const vector<string>& arguments, const string& workingDirectory,
                       const ApplicationDescriptor& descriptor, const string& principal);

};

typedef shared_ptr<AbsLauncher> AbsLauncherPtr;

#endif /* LIFECYCLE_LAUNCHER_ABSLAUNCHER_H_ */
