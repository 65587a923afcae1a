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

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <sstream>
#include <glib.h>

#include "MainDaemon.h"
#include "conf/LAMConf.h"
#include "util/Logger.h"
#include "util/File.h"

static const char* CLASS_NAME = "Main";

static gchar* s_confPath = NULL;
static gchar* s_catalogPath = NULL;
static gboolean s_list = FALSE;
static gchar** s_appIds = NULL;

static GOptionEntry s_entries[] = {
    { "conf", 'c', 0, G_OPTION_ARG_FILENAME, &s_confPath, "Configuration file", "PATH" },
    { "catalog", 'a', 0, G_OPTION_ARG_FILENAME, &s_catalogPath, "Application catalog file", "PATH" },
    { "list", 'l', 0, G_OPTION_ARG_NONE, &s_list, "Print the application catalog and exit", NULL },
    { G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_STRING_ARRAY, &s_appIds, "Applications to launch", "APP_ID..." },
    { NULL }
};

void signal_handler(int signal, siginfo_t *siginfo, void *context)
{
    stringstream stream;
    stream << siginfo->si_pid;
    string sender_cmdline = "/proc/" + stream.str() + "/cmdline";

    string buf = File::readFile(sender_cmdline);
    Logger::warning(CLASS_NAME, __FUNCTION__, Logger::format("signal(%d) si_code(%d) sender(%s) si_pid(%d) si_uid(%d)",
                    signal, siginfo->si_code, buf.c_str(), siginfo->si_pid, siginfo->si_uid));

    if (signal == SIGHUP || signal == SIGPIPE) {
        Logger::warning(CLASS_NAME, __FUNCTION__, "Ignore received signal");
        return;
    }
    Logger::warning(CLASS_NAME, __FUNCTION__, "Try to terminate LAM process");
    MainDaemon::getInstance().stop();
}

int main(int argc, char **argv)
{
    GError* gerr = NULL;
    GOptionContext* context = g_option_context_new("- application lifecycle manager");
    g_option_context_add_main_entries(context, s_entries, NULL);
    if (!g_option_context_parse(context, &argc, &argv, &gerr)) {
        fprintf(stderr, "%s\n", gerr->message);
        g_error_free(gerr);
        g_option_context_free(context);
        return EXIT_FAILURE;
    }
    g_option_context_free(context);

    string confPath = s_confPath ? s_confPath : "";
    string catalogPath = s_catalogPath ? s_catalogPath : "";
    vector<string> appIds;
    for (gchar** appId = s_appIds; appId && *appId; ++appId) {
        appIds.push_back(*appId);
    }
    g_free(s_confPath);
    g_free(s_catalogPath);
    g_strfreev(s_appIds);

    if (s_list) {
        LAMConf::getInstance().initialize(confPath);
        ApplicationCatalog& catalog = MainDaemon::getInstance().getCatalog();
        if (!catalog.load(catalogPath.empty() ? LAMConf::getInstance().getCatalogPath() : catalogPath))
            return EXIT_FAILURE;

        pbnjson::JValue array = pbnjson::Array();
        catalog.toJson(array);
        printf("%s\n", array.stringify("    ").c_str());
        return EXIT_SUCCESS;
    }

    Logger::info(CLASS_NAME, __FUNCTION__, "Start LAM process");

    // tracking sender if we get some signal
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_sigaction = signal_handler;
    act.sa_flags = SA_SIGINFO;

    sigaction(SIGHUP, &act, NULL);
    sigaction(SIGPIPE, &act, NULL);

    sigaction(SIGINT, &act, NULL);
    sigaction(SIGTERM, &act, NULL);
    sigaction(SIGQUIT, &act, NULL);

    if (!MainDaemon::getInstance().initialize(confPath, catalogPath)) {
        MainDaemon::getInstance().finalize();
        return EXIT_FAILURE;
    }
    MainDaemon::getInstance().scheduleLaunch(appIds);
    MainDaemon::getInstance().start();
    MainDaemon::getInstance().finalize();

    return EXIT_SUCCESS;
}
