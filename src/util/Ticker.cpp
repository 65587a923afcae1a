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

#include "util/Ticker.h"

#include "util/Logger.h"

Ticker::Ticker(const string& name, guint interval)
    : m_interval(interval),
      m_context(nullptr),
      m_loop(nullptr),
      m_thread(nullptr)
{
    setClassName(name);
}

Ticker::~Ticker()
{
    stop();
}

void Ticker::start()
{
    lock_guard<mutex> lock(m_mutex);
    if (m_thread)
        return;

    m_context = g_main_context_new();
    m_loop = g_main_loop_new(m_context, FALSE);

    GSource* source = g_timeout_source_new(m_interval);
    g_source_set_callback(source, onTimeout, this, NULL);
    g_source_attach(source, m_context);
    g_source_unref(source);

    m_thread = g_thread_new(getClassName().c_str(), onThread, g_main_loop_ref(m_loop));
    Logger::info(getClassName(), __FUNCTION__, Logger::format("interval(%u)", m_interval));
}

void Ticker::stop()
{
    GThread* thread = nullptr;
    GMainContext* context = nullptr;
    GMainLoop* loop = nullptr;
    {
        lock_guard<mutex> lock(m_mutex);
        if (!m_thread)
            return;
        thread = m_thread;
        context = m_context;
        loop = m_loop;
        m_thread = nullptr;
        m_context = nullptr;
        m_loop = nullptr;
    }

    GSource* source = g_idle_source_new();
    g_source_set_callback(source, onQuit, loop, NULL);
    g_source_attach(source, context);
    g_source_unref(source);

    if (g_thread_self() != thread) {
        g_thread_join(thread);
    } else {
        Logger::warning(getClassName(), __FUNCTION__, "Stopped from its own thread");
        g_thread_unref(thread);
    }

    g_main_loop_unref(loop);
    g_main_context_unref(context);
    Logger::info(getClassName(), __FUNCTION__, "Stopped");
}

bool Ticker::isRunning()
{
    lock_guard<mutex> lock(m_mutex);
    return m_thread != nullptr;
}

void Ticker::setInterval(guint interval)
{
    m_interval = interval;
    if (isRunning()) {
        stop();
        start();
    }
}

gpointer Ticker::onThread(gpointer data)
{
    GMainLoop* loop = static_cast<GMainLoop*>(data);
    GMainContext* context = g_main_loop_get_context(loop);

    g_main_context_push_thread_default(context);
    g_main_loop_run(loop);
    g_main_context_pop_thread_default(context);

    g_main_loop_unref(loop);
    return NULL;
}

gboolean Ticker::onTimeout(gpointer data)
{
    Ticker* self = static_cast<Ticker*>(data);
    try {
        self->EventTick();
    } catch (const std::exception& e) {
        Logger::error(self->getClassName(), __FUNCTION__, "Tick failed", e.what());
    }
    return G_SOURCE_CONTINUE;
}

gboolean Ticker::onQuit(gpointer data)
{
    g_main_loop_quit(static_cast<GMainLoop*>(data));
    return G_SOURCE_REMOVE;
}
