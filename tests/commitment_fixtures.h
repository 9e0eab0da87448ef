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

// Test-side encoder producing the same compact layout as the Proof of SQL
// commitment producers, plus ready-made table commitments per scheme.

#pragma once
#include "../lib/curve_mcl.hpp"
#include "../lib/postcard.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace commit_utility {
namespace testing_fixtures {

class PostcardWriter {
public:
    PostcardWriter& varint(u128 v){
        while(v>=0x80){ buf_.push_back((uint8_t)((v & 0x7f) | 0x80)); v >>= 7; }
        buf_.push_back((uint8_t)v);
        return *this;
    }
    PostcardWriter& u8(uint8_t v){ buf_.push_back(v); return *this; }
    PostcardWriter& i8(int8_t v){ buf_.push_back((uint8_t)v); return *this; }
    PostcardWriter& usize(uint64_t v){ return varint(v); }
    PostcardWriter& i32(int32_t v){ return varint((uint32_t)((uint32_t)v << 1) ^ (uint32_t)(v >> 31)); }
    PostcardWriter& i64(int64_t v){ return varint((uint64_t)((uint64_t)v << 1) ^ (uint64_t)(v >> 63)); }
    PostcardWriter& i128v(i128 v){ return varint(((u128)v << 1) ^ (u128)(v >> 127)); }
    PostcardWriter& variant(uint32_t tag){ return varint(tag); }
    PostcardWriter& str(const std::string& s){
        usize(s.size());
        buf_.insert(buf_.end(), s.begin(), s.end());
        return *this;
    }
    PostcardWriter& raw(const std::vector<uint8_t>& b){
        buf_.insert(buf_.end(), b.begin(), b.end());
        return *this;
    }
    PostcardWriter& byteBuf(const std::vector<uint8_t>& b){
        usize(b.size());
        return raw(b);
    }
    // Ident { value, quote_style: None }
    PostcardWriter& ident(const std::string& value){ str(value); return u8(0); }
    PostcardWriter& quotedIdent(const std::string& value, const std::string& quote){
        str(value); u8(1); return str(quote);
    }

    const std::vector<uint8_t>& bytes() const { return buf_; }

private:
    std::vector<uint8_t> buf_;
};

// Ristretto255 generator B and 2B (RFC 9496, appendix A.1)
inline std::vector<uint8_t> ristrettoBasepoint(){
    return curve::bytesFromHex("e2f2ae0a6abc4e71a884a961c500515f58e30b6aa582dd8db6a65945e08d2d76");
}
inline std::vector<uint8_t> ristrettoTwoB(){
    return curve::bytesFromHex("6a493210f7499cd17fecb510ae0cea23a110e8d5b901f8acadd3095c73a3b919");
}

inline curve::G1 sampleG1(int seed){
    curve::initCurves();
    curve::G1 P;
    mcl::bn::mapToG1(P, seed);
    return P;
}

inline std::vector<uint8_t> compressedG1(const curve::G1& P){
    std::vector<uint8_t> out(curve::kG1CompressedBytes);
    size_t n = P.serialize(out.data(), out.size());
    out.resize(n);
    return out;
}

inline curve::GT sampleGT(int seed){
    curve::initCurves();
    curve::G1 P; mcl::bn::mapToG1(P, seed);
    mcl::bn::G2 Q; mcl::bn::mapToG2(Q, 1);
    curve::GT e;
    mcl::bn::pairing(e, P, Q);
    return e;
}

// Two columns: "a" BigInt with sharp bounds, "b" (quoted) VarChar.
inline void writeSampleMetadata(PostcardWriter& w){
    w.usize(2);
    w.ident("a");
    w.variant(5);                  // ColumnType::BigInt
    w.variant(5);                  // ColumnBounds::BigInt
    w.variant(1);                  // Bounds::Sharp
    w.i64(-5).i64(10);
    w.quotedIdent("b", "\"");
    w.variant(8);                  // ColumnType::VarChar
    w.variant(0);                  // ColumnBounds::NoOrder
}

inline std::vector<uint8_t> ipaTable(){
    PostcardWriter w;
    w.usize(2).raw(ristrettoBasepoint()).raw(ristrettoTwoB());
    writeSampleMetadata(w);
    w.usize(0).usize(3);
    return w.bytes();
}

inline std::vector<uint8_t> doryTable(){
    PostcardWriter w;
    w.usize(2).byteBuf(curve::encodeGT(sampleGT(1))).byteBuf(curve::encodeGT(sampleGT(2)));
    writeSampleMetadata(w);
    w.usize(4).usize(9);
    return w.bytes();
}

inline std::vector<uint8_t> dynamicDoryTable(){
    PostcardWriter w;
    w.usize(2).byteBuf(compressedG1(sampleG1(1))).byteBuf(compressedG1(sampleG1(2)));
    writeSampleMetadata(w);
    w.usize(0).usize(1024);
    return w.bytes();
}

// ---------------- temp files ----------------
inline std::string tempPath(const std::string& name){
    return (std::filesystem::temp_directory_path() / ("commit_utility_test_" + name)).string();
}

inline void writeFile(const std::string& path, const std::vector<uint8_t>& data){
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline std::string readFile(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

} // namespace testing_fixtures
} // namespace commit_utility
