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

#ifndef CLIENT_LINUXPROCESSTABLE_H_
#define CLIENT_LINUXPROCESSTABLE_H_

#include "client/AbsProcessTable.h"
#include "interface/IClassName.h"

class LinuxProcessTable : public AbsProcessTable,
                          public IClassName {
public:
    LinuxProcessTable();
    virtual ~LinuxProcessTable();

    virtual bool isAlive(pid_t pid) override;
    virtual bool getInfo(pid_t pid, ProcessInfo& info) override;
    virtual bool term(pid_t pid) override;
    virtual bool kill(pid_t pid) override;
    virtual pid_t getSelfPid() override;

};

#endif /* CLIENT_LINUXPROCESSTABLE_H_ */
