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

#ifndef CLIENT_ABSANDROIDSUBSYSTEM_H_
#define CLIENT_ABSANDROIDSUBSYSTEM_H_

#include <iostream>

using namespace std;

// Front end of the Android compatibility layer
class AbsAndroidSubsystem {
public:
    AbsAndroidSubsystem() {};
    virtual ~AbsAndroidSubsystem() {};

    virtual bool isAvailable() = 0;
    virtual bool isInstalled(const string& packageName) = 0;

    // activity may be empty. Then the launcher activity of the package is started.
    virtual bool launch(const string& packageName, const string& activity, string& errorText) = 0;
    // Force-stops every activity of the package
    virtual bool stop(const string& packageName, string& errorText) = 0;

};

#endif /* CLIENT_ABSANDROIDSUBSYSTEM_H_ */
