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

#include "lifecycle/launcher/FolderLauncher.h"

#include "conf/LAMConf.h"
#include "util/File.h"
#include "util/Logger.h"

FolderLauncher::FolderLauncher()
{
    setClassName("FolderLauncher");
}

FolderLauncher::~FolderLauncher()
{
}

LaunchResult FolderLauncher::launch(const ApplicationDescriptor& descriptor, const string& principal)
{
    string path = descriptor.getTarget();
    File::trimPath(path);
    if (path.empty() || !File::isDirectory(path)) {
        Logger::warning(getClassName(), __FUNCTION__, descriptor.getId(), "Folder not found", path);
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "Folder not found: " + path);
    }

    string fileManager = findFirstProgram(LAMConf::getInstance().getFileManagerPaths());
    if (fileManager.empty())
        return LaunchResult::failure(ErrCode_LAUNCH_FAILED, "No file manager available");

    LaunchResult result = spawn(fileManager, { path }, path, descriptor, principal);
    if (result.isSuccess())
        result.setMetadata("FolderPath", path);
    return result;
}
