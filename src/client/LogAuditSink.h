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

#ifndef CLIENT_LOGAUDITSINK_H_
#define CLIENT_LOGAUDITSINK_H_

#include "interface/IAuditSink.h"
#include "interface/IClassName.h"

// Writes every lifecycle event to the log under the "Audit" tag
class LogAuditSink : public IAuditSink,
                     public IClassName {
public:
    LogAuditSink();
    virtual ~LogAuditSink();

    virtual void record(const InstanceEvent& event) override;

};

#endif /* CLIENT_LOGAUDITSINK_H_ */
