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

#include "commit_io.h"
#include "commit_error.h"
#include "debug_log.h"
#include <cstdio>
#include <fstream>

namespace commit_utility {

bool readStream(std::istream& in, std::vector<uint8_t>& out){
    char chunk[64 * 1024];
    while(in.read(chunk, sizeof(chunk)) || in.gcount()>0){
        out.insert(out.end(), chunk, chunk + in.gcount());
    }
    return !in.bad();
}

bool readStream(FILE* in, std::vector<uint8_t>& out){
    uint8_t chunk[64 * 1024];
    size_t n;
    while((n = fread(chunk, 1, sizeof(chunk), in)) > 0){
        out.insert(out.end(), chunk, chunk + n);
    }
    return !ferror(in);
}

std::vector<uint8_t> readInput(const std::optional<std::string>& path){
    std::vector<uint8_t> data;
    if(path){
        std::ifstream f(*path, std::ios::binary);
        if(!f.is_open()) throw CommitUtilityException(OpenInputFile{*path});
        if(!readStream(f, data)) throw CommitUtilityException(ReadInputFile{*path});
        dbg("read " + std::to_string(data.size()) + " bytes from " + *path);
    }else{
        // std::cin's stdio-synced buffer reports a read error as end of input
        if(!readStream(stdin, data)) throw CommitUtilityException(ReadStdin{});
        dbg("read " + std::to_string(data.size()) + " bytes from stdin");
    }
    return data;
}

void writeOutput(const std::optional<std::string>& path, const std::string& text){
    if(path){
        std::ofstream f(*path, std::ios::binary | std::ios::trunc);
        if(!f.is_open()) throw CommitUtilityException(CreateOutputFile{*path});
        f.write(text.data(), (std::streamsize)text.size());
        f.flush();
        f.close();
        if(f.fail()) throw CommitUtilityException(WriteOutputFile{*path});
        dbg("wrote " + std::to_string(text.size()) + " bytes to " + *path);
    }else{
        size_t n = fwrite(text.data(), 1, text.size(), stdout);
        if(n!=text.size() || fflush(stdout)!=0) throw CommitUtilityException(WriteStdout{});
    }
}

} // namespace commit_utility
