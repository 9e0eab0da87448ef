// Copyright 2025 Fidesinnova.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <cstdio>
#include <string>

namespace commit_utility {

// Breadcrumbs on stderr, enabled with --debug.
inline bool& debugEnabled(){
    static bool enabled = false;
    return enabled;
}

inline void setDebug(bool on){ debugEnabled() = on; }

inline void dbg(const std::string& s){
    if(debugEnabled()) fprintf(stderr, "[DBG] %s\n", s.c_str());
}

} // namespace commit_utility
