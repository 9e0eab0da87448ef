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

// postcard.h
//
// Cursor over the compact ("postcard") serialization written by the
// Proof of SQL commitment producers.
//
//   u8 / i8              one raw byte
//   u16..u128, usize     LEB128 varint, at most ceil(bits/7) bytes
//   i16..i128            zig-zag, then varint
//   bool                 0 or 1
//   Option<T>            0 | 1 T
//   String               usize length + UTF-8 bytes
//   char                 usize length <= 4 + UTF-8; first code point kept
//   Vec<T>, maps         usize count + elements
//   enum                 u32 variant index + payload
//
// Every read either consumes a complete value or throws PostcardError.

#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace commit_utility {

using u128 = unsigned __int128;
using i128 = __int128;

class PostcardError : public std::runtime_error {
public:
    PostcardError(size_t offset, const std::string& what);

    size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

class PostcardReader {
public:
    explicit PostcardReader(const std::vector<uint8_t>& bytes);
    PostcardReader(const uint8_t* data, size_t size);

    uint8_t  readU8();
    int8_t   readI8();
    uint16_t readU16();
    uint32_t readU32();
    uint64_t readU64();
    uint64_t readUsize();
    u128     readU128();
    int16_t  readI16();
    int32_t  readI32();
    int64_t  readI64();
    i128     readI128();

    bool readBool();
    // Some/None tag of an Option<T>; the payload is read by the caller.
    bool readOptionTag();
    uint32_t readVariant();
    // Element count of a sequence or map.
    uint64_t readLength();

    std::string readString();
    // UTF-8 encoding of the first code point of an up-to-4-byte string.
    std::string readChar();
    std::vector<uint8_t> readFixed(size_t n);
    // usize length followed by raw bytes.
    std::vector<uint8_t> readByteBuf();

    size_t offset() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }

    [[noreturn]] void fail(const std::string& what) const;

private:
    u128 readVarint(unsigned bits);

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
// Sets codePoints to the number of scalar values when valid.
bool validUtf8(const uint8_t* s, size_t n, size_t* codePoints = nullptr);

} // namespace commit_utility
