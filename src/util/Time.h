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

#ifndef UTIL_TIME_H_
#define UTIL_TIME_H_

#include <string>
#include <time.h>

using namespace std;

class Time {
public:
    // Milliseconds on the monotonic clock. Used for elapsed time and window correlation.
    static long long getCurrentTime();

    // Milliseconds since epoch. Used for timestamps exposed in snapshots and events.
    static long long getSystemTime();

    static string toISO8601(long long systemTime);

    static string generateUid();

    static void sleep(long long milliseconds);

    Time();
    virtual ~Time();

};

#endif /* UTIL_TIME_H_ */
