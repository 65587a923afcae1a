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

#ifndef LIFECYCLE_LAUNCHER_FOLDERLAUNCHER_H_
#define LIFECYCLE_LAUNCHER_FOLDERLAUNCHER_H_

#include "lifecycle/launcher/AbsLauncher.h"

// Opens target directory with the first installed file manager
class FolderLauncher : public AbsLauncher {
public:
    FolderLauncher();
    virtual ~FolderLauncher();

    virtual AppKind getSupportedKind() const override
    {
        return AppKind::AppKind_Folder;
    }

    virtual CorrelationMode getCorrelationMode() const override
    {
        return CorrelationMode::CorrelationMode_None;
    }

    virtual LaunchResult launch(const ApplicationDescriptor& descriptor, const string& principal) override;

};

#endif /* LIFECYCLE_LAUNCHER_FOLDERLAUNCHER_H_ */
