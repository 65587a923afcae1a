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

#include "Time.h"

#include <glib.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/lexical_cast.hpp>

#include <mutex>

Time::Time()
{
}

Time::~Time()
{
}

long long Time::getCurrentTime()
{
    timespec now;
    if (clock_gettime(CLOCK_MONOTONIC, &now) == -1)
        return -1;
    return ((long long) now.tv_sec * 1000) + (now.tv_nsec / 1000000);
}

long long Time::getSystemTime()
{
    timespec now;
    if (clock_gettime(CLOCK_REALTIME, &now) == -1)
        return -1;
    return ((long long) now.tv_sec * 1000) + (now.tv_nsec / 1000000);
}

string Time::toISO8601(long long systemTime)
{
    if (systemTime <= 0)
        return "";

    time_t seconds = (time_t) (systemTime / 1000);
    struct tm utc;
    if (gmtime_r(&seconds, &utc) == nullptr)
        return "";

    char buffer[32];
    size_t length = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buffer + length, sizeof(buffer) - length, ".%03dZ", (int) (systemTime % 1000));
    return string(buffer);
}

string Time::generateUid()
{
    // random_generator is not thread-safe
    static mutex s_mutex;
    static boost::uuids::random_generator s_generator;

    lock_guard<mutex> lock(s_mutex);
    boost::uuids::uuid uid = s_generator();
    return string(boost::lexical_cast<string>(uid));
}

void Time::sleep(long long milliseconds)
{
    if (milliseconds <= 0)
        return;
    g_usleep((gulong) (milliseconds * 1000));
}
