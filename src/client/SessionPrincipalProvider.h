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

#ifndef CLIENT_SESSIONPRINCIPALPROVIDER_H_
#define CLIENT_SESSIONPRINCIPALPROVIDER_H_

#include "interface/IClassName.h"
#include "interface/IPrincipalProvider.h"

// The desktop session user is the principal of every launch
class SessionPrincipalProvider : public IPrincipalProvider,
                                 public IClassName {
public:
    SessionPrincipalProvider();
    virtual ~SessionPrincipalProvider();

    virtual string getCurrentPrincipal() override;

};

#endif /* CLIENT_SESSIONPRINCIPALPROVIDER_H_ */
