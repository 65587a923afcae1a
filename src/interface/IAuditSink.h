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

#ifndef INTERFACE_IAUDITSINK_H_
#define INTERFACE_IAUDITSINK_H_

#include "base/InstanceEvent.h"

// Receives every lifecycle event. Implementations may throw;
// the caller logs and drops the failure.
class IAuditSink {
public:
    IAuditSink() {};
    virtual ~IAuditSink() {};

    virtual void record(const InstanceEvent& event) = 0;

};

#endif /* INTERFACE_IAUDITSINK_H_ */
