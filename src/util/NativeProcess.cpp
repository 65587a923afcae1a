// Copyright (c) 2020-2026 LG Electronics, Inc.
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

#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#include "util/NativeProcess.h"
#include "util/Logger.h"

const string NativeProcess::CLASS_NAME = "NativeProcess";

map<string, string> NativeProcess::getSessionEnvironments()
{
    map<string, string> environments;
    gchar **variables = g_listenv();
    gsize size = variables ? g_strv_length(variables) : 0;
    for (gsize i = 0; i < size; i++) {
        const gchar *value = g_getenv(variables[i]);
        if (value != NULL) {
            environments[variables[i]] = value;
        }
    }
    g_strfreev(variables);
    return environments;
}

bool NativeProcess::parseArguments(const string& commandLine, vector<string>& arguments, string& errorText)
{
    arguments.clear();
    if (commandLine.find_first_not_of(" \t\r\n") == string::npos)
        return true;

    gint argc = 0;
    gchar** argv = NULL;
    GError* gerr = NULL;
    if (!g_shell_parse_argv(commandLine.c_str(), &argc, &argv, &gerr)) {
        errorText = gerr ? gerr->message : "Invalid arguments";
        if (gerr)
            g_error_free(gerr);
        return false;
    }
    for (gint i = 0; i < argc; ++i) {
        arguments.push_back(argv[i]);
    }
    g_strfreev(argv);
    return true;
}

void NativeProcess::convertEnvToStr(const map<string, string>& src, vector<string>& dest)
{
    for (auto it = src.begin(); it != src.end(); ++it) {
        dest.push_back(it->first + "=" + it->second);
    }
}

void NativeProcess::prepareSpawn(gpointer user_data)
{
    // This function is called in child context.
    // setpgid is needed to kill all processes which are created by application at once
    setpgid(0, 0);
}

NativeProcess::NativeProcess()
    : m_workingDirectory("/"),
      m_command(""),
      m_pid(-1),
      m_stdFd(-1)
{

}

NativeProcess::~NativeProcess()
{
    closeStdFd();
}

void NativeProcess::addArgument(const string& argument)
{
    m_arguments.push_back(argument);
}

void NativeProcess::addArgument(const string& option, const string& value)
{
    m_arguments.push_back(option);
    m_arguments.push_back(value);
}

void NativeProcess::addArguments(const vector<string>& arguments)
{
    m_arguments.insert(m_arguments.end(), arguments.begin(), arguments.end());
}

void NativeProcess::addEnv(const map<string, string>& environments)
{
    for (auto it = environments.begin(); it != environments.end(); ++it) {
        m_environments[it->first] = it->second;
    }
}

void NativeProcess::addEnv(const string& variable, const string& value)
{
    m_environments[variable] = value;
}

void NativeProcess::openStdFile(const string& stdFile)
{
    closeStdFd();
    m_stdFile = stdFile;
    m_stdFd = ::open(stdFile.c_str(), O_CREAT | O_RDWR | O_TRUNC, 0644);
    if (m_stdFd < 0) {
        Logger::warning(CLASS_NAME, __FUNCTION__, stdFile, strerror(errno));
    }
}

void NativeProcess::closeStdFd()
{
    if (m_stdFd >= 0) {
        close(m_stdFd);
        m_stdFd = -1;
    }
}

bool NativeProcess::run(string& errorText)
{
    if (m_command.empty()) {
        errorText = "Command is empty";
        return false;
    }

    vector<const char*> argv;
    vector<const char*> envp;
    string params = "";

    argv.push_back(m_command.c_str());
    for (auto it = m_arguments.begin(); it != m_arguments.end(); ++it) {
        params += *it + " ";
        argv.push_back(it->c_str());
    }
    argv.push_back(NULL);

    vector<string> finalEnvironments;
    convertEnvToStr(m_environments, finalEnvironments);
    for (auto it = finalEnvironments.begin(); it != finalEnvironments.end(); ++it) {
        envp.push_back(it->c_str());
    }
    envp.push_back(NULL);

    Logger::info(CLASS_NAME, __FUNCTION__, m_command, params);
    GError* gerr = NULL;
    GPid pid = -1;
    gboolean result = g_spawn_async_with_fds(
        m_workingDirectory.c_str(),
        const_cast<char**>(argv.data()),
        const_cast<char**>(envp.data()),
        (GSpawnFlags) (G_SPAWN_DO_NOT_REAP_CHILD | G_SPAWN_SEARCH_PATH_FROM_ENVP),
        prepareSpawn,
        this,
        &pid,
        -1,
        m_stdFd,
        m_stdFd,
        &gerr
    );
    if (gerr) {
        errorText = gerr->message;
        Logger::error(CLASS_NAME, __FUNCTION__, m_command, gerr->message);
        g_error_free(gerr);
        gerr = NULL;
        return false;
    }
    if (!result || pid <= 0) {
        errorText = "Failed to fork child process";
        Logger::error(CLASS_NAME, __FUNCTION__, m_command, errorText);
        return false;
    }
    m_pid = pid;
    return true;
}
