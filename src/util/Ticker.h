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

#ifndef UTIL_TICKER_H_
#define UTIL_TICKER_H_

#include <iostream>
#include <mutex>

#include <glib.h>
#include <boost/signals2.hpp>

#include "interface/IClassName.h"

using namespace std;

// Runs EventTick periodically on a dedicated GMainContext/GMainLoop thread.
class Ticker : public IClassName {
public:
    Ticker(const string& name, guint interval);
    virtual ~Ticker();

    // No-op when already running
    void start();
    // Quits the loop and joins the thread. No-op when not running.
    void stop();

    bool isRunning();

    void setInterval(guint interval);
    guint getInterval() const
    {
        return m_interval;
    }

    // Called on the ticker thread. Slots must not call stop() on the same ticker.
    boost::signals2::signal<void()> EventTick;

private:
    static gpointer onThread(gpointer data);
    static gboolean onTimeout(gpointer data);
    static gboolean onQuit(gpointer data);

    Ticker(const Ticker&);
    Ticker& operator=(const Ticker&);

    guint m_interval;

    mutex m_mutex;
    GMainContext* m_context;
    GMainLoop* m_loop;
    GThread* m_thread;

};

#endif /* UTIL_TICKER_H_ */
