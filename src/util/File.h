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

#ifndef UTIL_FILE_H_
#define UTIL_FILE_H_

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/types.h>
#include <sys/stat.h>

using namespace std;

class File {
public:
    static string readFile(const string& path);
    static bool writeFile(const string& path, const string& buffer);

    static bool isDirectory(const string& path);
    static bool isFile(const string& path);
    static bool isExecutable(const string& path);
    static bool makeDirectory(const string& path);

    // Resolves a bare command name against PATH. Absolute or relative paths are returned as-is when executable.
    static string findProgram(const string& command);

    static string join(const string& a, const string& b);
    static string getBaseName(const string& path);

    static void trimPath(string &path)
    {
        if (path.size() > 1 && path.back() == '/')
            path.erase(std::prev(path.end()));
    }

    File();
    virtual ~File();

};

#endif /* UTIL_FILE_H_ */
