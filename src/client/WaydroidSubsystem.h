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

#ifndef CLIENT_WAYDROIDSUBSYSTEM_H_
#define CLIENT_WAYDROIDSUBSYSTEM_H_

#include <vector>

#include "client/AbsAndroidSubsystem.h"
#include "interface/IClassName.h"

class WaydroidSubsystem : public AbsAndroidSubsystem,
                          public IClassName {
public:
    WaydroidSubsystem(const string& command);
    virtual ~WaydroidSubsystem();

    virtual bool isAvailable() override;
    virtual bool isInstalled(const string& packageName) override;
    virtual bool launch(const string& packageName, const string& activity, string& errorText) override;
    virtual bool stop(const string& packageName, string& errorText) override;

    // "packageName: <name>" lines of 'app list'
    static vector<string> parsePackages(const string& output);

private:
    bool run(const vector<string>& arguments, string& output, string& errorText);

    string m_command;

};

#endif /* CLIENT_WAYDROIDSUBSYSTEM_H_ */
