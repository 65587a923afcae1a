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

#include "File.h"

#include <glib.h>
#include <glib/gstdio.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

string File::readFile(const string& path)
{
    ifstream file(path.c_str(), ifstream::in);
    string contents;

    if (file.is_open() && file.good()) {
        stringstream buf;
        buf << file.rdbuf();
        contents = buf.str();
    }

    return contents;
}

bool File::writeFile(const string &path, const string& buffer)
{
    ofstream file(path.c_str());
    if (file.is_open()) {
        file << buffer;
        file.close();
    } else {
        return false;
    }
    return true;
}

bool File::isDirectory(const string& path)
{
    struct stat dirStat;
    if (stat(path.c_str(), &dirStat) != 0 || (dirStat.st_mode & S_IFDIR) == 0) {
        return false;
    }
    return true;
}

bool File::isFile(const string& path)
{
    struct stat fileStat;

    if (stat(path.c_str(), &fileStat) != 0 || (fileStat.st_mode & S_IFREG) == 0) {
        return false;
    }
    return true;
}

bool File::isExecutable(const string& path)
{
    return isFile(path) && access(path.c_str(), X_OK) == 0;
}

bool File::makeDirectory(const string& path)
{
    if (isDirectory(path))
        return true;
    return g_mkdir_with_parents(path.c_str(), 0755) == 0;
}

string File::findProgram(const string& command)
{
    if (command.empty())
        return "";

    if (command.find('/') != string::npos) {
        return isExecutable(command) ? command : "";
    }

    gchar* found = g_find_program_in_path(command.c_str());
    if (found == nullptr)
        return "";
    string path = found;
    g_free(found);
    return path;
}

string File::join(const string& a, const string& b)
{
    if (a.empty())
        return b;
    if (b.empty())
        return a;

    string path = "";

    if (a.back() == '/') {
        if (b.front() == '/') {
            path = a + b.substr(1);
        }
        else {
            path = a + b;
        }
    } else {
        if (b.front() == '/') {
            path = a + b;
        }
        else {
            path = a + "/" + b;
        }
    }
    return path;
}

string File::getBaseName(const string& path)
{
    string trimmed = path;
    trimPath(trimmed);

    size_t pos = trimmed.find_last_of('/');
    if (pos == string::npos)
        return trimmed;
    return trimmed.substr(pos + 1);
}

File::File()
{
}

File::~File()
{
}
