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

#include "postcard.h"

namespace commit_utility {

PostcardError::PostcardError(size_t offset, const std::string& what)
    : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}

PostcardReader::PostcardReader(const std::vector<uint8_t>& bytes)
    : data_(bytes.data()), size_(bytes.size()) {}

PostcardReader::PostcardReader(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

void PostcardReader::fail(const std::string& what) const {
    throw PostcardError(pos_, what);
}

u128 PostcardReader::readVarint(unsigned bits){
    const unsigned maxBytes = (bits + 6) / 7;
    const size_t start = pos_;
    u128 value = 0;
    for(unsigned i=0;i<maxBytes;i++){
        if(pos_>=size_){
            pos_ = start;
            fail("unexpected end of input in varint");
        }
        uint8_t byte = data_[pos_++];
        if(i==maxBytes-1){
            // only the bits that still fit the target width may be set
            unsigned lastBits = bits - 7*i;
            if((byte >> lastBits) != 0){
                pos_ = start;
                fail("varint overflows " + std::to_string(bits) + "-bit integer");
            }
        }
        value |= (u128)(byte & 0x7f) << (7*i);
        if((byte & 0x80)==0) return value;
    }
    pos_ = start;
    fail("bad varint");
}

uint8_t PostcardReader::readU8(){
    if(pos_>=size_) fail("unexpected end of input");
    return data_[pos_++];
}

int8_t PostcardReader::readI8(){ return (int8_t)readU8(); }

uint16_t PostcardReader::readU16(){ return (uint16_t)readVarint(16); }
uint32_t PostcardReader::readU32(){ return (uint32_t)readVarint(32); }
uint64_t PostcardReader::readU64(){ return (uint64_t)readVarint(64); }
uint64_t PostcardReader::readUsize(){ return (uint64_t)readVarint(64); }
u128     PostcardReader::readU128(){ return readVarint(128); }

int16_t PostcardReader::readI16(){
    uint16_t n = readU16();
    return (int16_t)((n >> 1) ^ (uint16_t)(-(int16_t)(n & 1)));
}

int32_t PostcardReader::readI32(){
    uint32_t n = readU32();
    return (int32_t)((n >> 1) ^ (uint32_t)(-(int32_t)(n & 1)));
}

int64_t PostcardReader::readI64(){
    uint64_t n = readU64();
    return (int64_t)((n >> 1) ^ (uint64_t)(-(int64_t)(n & 1)));
}

i128 PostcardReader::readI128(){
    u128 n = readU128();
    return (i128)((n >> 1) ^ (u128)(-(i128)(n & 1)));
}

bool PostcardReader::readBool(){
    uint8_t b = readU8();
    if(b>1){
        --pos_;
        fail("invalid bool tag " + std::to_string(b));
    }
    return b==1;
}

bool PostcardReader::readOptionTag(){
    uint8_t b = readU8();
    if(b>1){
        --pos_;
        fail("invalid option tag " + std::to_string(b));
    }
    return b==1;
}

uint32_t PostcardReader::readVariant(){ return readU32(); }

uint64_t PostcardReader::readLength(){ return readUsize(); }

std::vector<uint8_t> PostcardReader::readFixed(size_t n){
    if(n>remaining()) fail("need " + std::to_string(n) + " bytes, " + std::to_string(remaining()) + " left");
    std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return out;
}

std::vector<uint8_t> PostcardReader::readByteBuf(){
    uint64_t len = readLength();
    if(len>remaining()) fail("byte string length " + std::to_string(len) + " exceeds input");
    return readFixed((size_t)len);
}

std::string PostcardReader::readString(){
    const size_t start = pos_;
    uint64_t len = readLength();
    if(len>remaining()) fail("string length " + std::to_string(len) + " exceeds input");
    if(!validUtf8(data_ + pos_, (size_t)len)){
        pos_ = start;
        fail("string is not valid UTF-8");
    }
    std::string s(reinterpret_cast<const char*>(data_ + pos_), (size_t)len);
    pos_ += (size_t)len;
    return s;
}

std::string PostcardReader::readChar(){
    const size_t start = pos_;
    uint64_t len = readLength();
    if(len>4){
        pos_ = start;
        fail("char encoding longer than 4 bytes");
    }
    if(len>remaining()) fail("char length " + std::to_string(len) + " exceeds input");
    const uint8_t* p = data_ + pos_;
    if(len==0 || !validUtf8(p, (size_t)len)){
        pos_ = start;
        fail("char is not a UTF-8 code point");
    }
    pos_ += (size_t)len;
    // the first code point wins; any bytes after it are dropped
    size_t first = 1;
    if(p[0]>=0xf0) first = 4;
    else if(p[0]>=0xe0) first = 3;
    else if(p[0]>=0xc0) first = 2;
    return std::string(reinterpret_cast<const char*>(p), first);
}

bool validUtf8(const uint8_t* s, size_t n, size_t* codePoints){
    size_t i = 0, count = 0;
    while(i<n){
        uint8_t c = s[i];
        size_t extra;
        uint32_t cp;
        if(c<0x80){ extra = 0; cp = c; }
        else if((c & 0xe0)==0xc0){ extra = 1; cp = c & 0x1f; }
        else if((c & 0xf0)==0xe0){ extra = 2; cp = c & 0x0f; }
        else if((c & 0xf8)==0xf0){ extra = 3; cp = c & 0x07; }
        else return false;
        if(i+extra>=n && extra>0) return false;
        for(size_t k=1;k<=extra;k++){
            uint8_t cc = s[i+k];
            if((cc & 0xc0)!=0x80) return false;
            cp = (cp << 6) | (cc & 0x3f);
        }
        // overlong forms
        if((extra==1 && cp<0x80) || (extra==2 && cp<0x800) || (extra==3 && cp<0x10000)) return false;
        if(cp>0x10ffff) return false;
        if(cp>=0xd800 && cp<=0xdfff) return false;
        i += extra + 1;
        ++count;
    }
    if(codePoints) *codePoints = count;
    return true;
}

} // namespace commit_utility
