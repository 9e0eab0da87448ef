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

// curve_mcl.hpp
// Commitment element decoding using Herumi mcl (https://github.com/herumi/mcl)
//
// Build deps (Ubuntu):
//   git clone --depth=1 https://github.com/herumi/mcl && cd mcl && mkdir build && cd build
//   cmake .. -DMCL_STATIC_LIB=ON -DMCL_USE_OPENSSL=ON && make -j
//   sudo make install
//
// Link flags:  -lmcl -lcrypto
//
// API summary:
//   curve::initCurves();                               // once per process
//   curve::decodeRistretto(bytes32, x, y);             // IPA commitments
//   curve::decodeG1Compressed(bytes, 48, P);           // Dynamic Dory commitments
//   curve::decodeGT(bytes, 576, T);                    // Dory commitments
//
// Decoders return false on any structural failure and never leave a
// half-written result visible to the caller.

#pragma once
#include <mcl/bn.hpp>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace commit_utility {
namespace curve {

using Fp = mcl::bn::Fp;
using G1 = mcl::bn::G1;
using GT = mcl::bn::Fp12;

// GF(2^255 - 19), base field of Curve25519 / Ristretto255
struct Curve25519Tag;
using Fe = mcl::FpT<Curve25519Tag, 256>;

constexpr size_t kFpBytes = 48;
constexpr size_t kG1CompressedBytes = 48;
constexpr size_t kGTBytes = 12 * kFpBytes;
constexpr size_t kRistrettoBytes = 32;

// ---------------- helpers ----------------
inline std::vector<uint8_t> bytesFromHex(const std::string& h){
    std::vector<uint8_t> v; v.reserve(h.size()/2);
    for(size_t i=0;i+1<h.size();i+=2){
        char t[3]={h[i],h[i+1],0};
        v.push_back((uint8_t)strtol(t,nullptr,16));
    }
    return v;
}

inline std::string hexOf(const uint8_t* b, size_t n){
    static const char* H="0123456789abcdef";
    std::string o; o.reserve(2+n*2);
    o += "0x";
    for(size_t i=0;i<n;i++){ o.push_back(H[b[i]>>4]); o.push_back(H[b[i]&0xf]); }
    return o;
}

template<class F>
inline std::string fieldHex(const F& x){
    return "0x" + x.getStr(16);
}

// z = x^e for a non-zero big-endian exponent
template<class F>
inline void powBE(F& z, const F& x, const std::vector<uint8_t>& e){
    F r;
    bool started=false;
    for(uint8_t byte : e){
        for(int bit=7; bit>=0; --bit){
            if(started) F::sqr(r, r);
            if((byte>>bit)&1){
                if(started) F::mul(r, r, x);
                else { r = x; started = true; }
            }
        }
    }
    z = r;
}

struct Constants {
    std::vector<uint8_t> groupOrderBE;   // r of BLS12-381
    std::vector<uint8_t> sqrtRatioExpBE; // (p-5)/8 = 2^252 - 3 for p = 2^255 - 19
    Fe edwardsD;                         // -121665/121666
    Fe sqrtM1;                           // 2^((p-1)/4)
};

inline Constants& constants(){
    static Constants c;
    return c;
}

inline void initCurves(){
    static bool inited=false;
    if(inited) return;

    bool ok=false;
    mcl::bn::initPairing(&ok, mcl::BLS12_381);
    if(!ok) throw std::runtime_error("mcl initPairing(BLS12_381) failed");
    // ZCash/arkworks compressed point flags, subgroup check on load
    mcl::bn::setETHserialization(true);
    mcl::bn::verifyOrderG1(true);

    Fe::init(&ok, "0x7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffed");
    if(!ok) throw std::runtime_error("mcl init of GF(2^255-19) failed");

    Constants& c = constants();
    c.groupOrderBE = bytesFromHex("73eda753299d7d483339d80809a1d80553bda402fffe5bfeffffffff00000001");
    c.sqrtRatioExpBE.assign(32, 0xff);
    c.sqrtRatioExpBE.front() = 0x0f;
    c.sqrtRatioExpBE.back()  = 0xfd;

    Fe num(121665), den(121666);
    Fe::inv(den, den);
    c.edwardsD = -(num * den);
    c.sqrtM1.setStr(&ok, "19681161376707505956807079304988542015446066515923890162744021073123829784752", 10);
    if(!ok) throw std::runtime_error("mcl: bad sqrt(-1) constant");

    inited = true;
}

// ---------------- Ristretto255 (RFC 9496, section 4.3.1) ----------------
inline bool feIsNegative(const Fe& x){
    uint8_t b[kRistrettoBytes] = {0};
    if(x.getLittleEndian(b, sizeof(b))==0) return false;
    return (b[0] & 1) != 0;
}

inline Fe feAbs(const Fe& x){
    return feIsNegative(x) ? Fe(-x) : x;
}

// (was_square, sqrt(u/v)) with the non-negative root
inline bool sqrtRatioM1(Fe& r, const Fe& u, const Fe& v){
    const Constants& c = constants();
    Fe v3 = v * v * v;
    Fe v7 = v3 * v3 * v;
    Fe t;
    powBE(t, Fe(u * v7), c.sqrtRatioExpBE);
    r = u * v3 * t;

    Fe check = v * r * r;
    Fe negU = -u;
    bool correctSign  = check == u;
    bool flippedSign  = check == negU;
    bool flippedSignI = check == negU * c.sqrtM1;
    if(flippedSign || flippedSignI) r = r * c.sqrtM1;
    r = feAbs(r);
    return correctSign || flippedSign;
}

// Decompress a Ristretto255 encoding to affine Edwards (x, y).
inline bool decodeRistretto(const uint8_t* bytes, Fe& xOut, Fe& yOut){
    const Constants& c = constants();
    Fe s;
    bool ok=false;
    s.setArray(&ok, bytes, kRistrettoBytes);   // rejects s >= p
    if(!ok) return false;
    if(feIsNegative(s)) return false;

    Fe one(1);
    Fe ss = s * s;
    Fe u1 = one - ss;
    Fe u2 = one + ss;
    Fe u2Sqr = u2 * u2;
    Fe v = -(c.edwardsD * u1 * u1) - u2Sqr;

    Fe invSqrt;
    bool wasSquare = sqrtRatioM1(invSqrt, one, v * u2Sqr);

    Fe denX = invSqrt * u2;
    Fe denY = invSqrt * denX * v;
    Fe two(2);
    Fe x = feAbs(two * s * denX);
    Fe y = u1 * denY;
    Fe t = x * y;

    if(!wasSquare || feIsNegative(t) || y.isZero()) return false;
    xOut = x;
    yOut = y;
    return true;
}

// ---------------- BLS12-381 ----------------
// 48-byte compressed G1 with ZCash flags; on-curve and subgroup checked by mcl.
inline bool decodeG1Compressed(const uint8_t* bytes, size_t n, G1& out){
    if(n!=kG1CompressedBytes) return false;
    G1 P;
    size_t read = P.deserialize(bytes, n);
    if(read!=kG1CompressedBytes) return false;
    out = P;
    return true;
}

// 12 little-endian Fq coefficients in tower order c0.c0.c0, c0.c0.c1, ... c1.c2.c1,
// accepted only when the element lies in the order-r subgroup.
inline bool decodeGT(const uint8_t* bytes, size_t n, GT& out){
    if(n!=kGTBytes) return false;
    GT T;
    mcl::bn::Fp6* halves[2] = {&T.a, &T.b};
    size_t k = 0;
    for(mcl::bn::Fp6* h : halves){
        mcl::bn::Fp2* parts[3] = {&h->a, &h->b, &h->c};
        for(mcl::bn::Fp2* p : parts){
            bool ok=false;
            p->a.setArray(&ok, bytes + kFpBytes*k++, kFpBytes);
            if(!ok) return false;
            p->b.setArray(&ok, bytes + kFpBytes*k++, kFpBytes);
            if(!ok) return false;
        }
    }
    GT check;
    powBE(check, T, constants().groupOrderBE);
    if(!check.isOne()) return false;
    out = T;
    return true;
}

// Inverse of decodeGT's coefficient layout.
inline std::vector<uint8_t> encodeGT(const GT& T){
    std::vector<uint8_t> out(kGTBytes, 0);
    const mcl::bn::Fp6* halves[2] = {&T.a, &T.b};
    size_t k = 0;
    for(const mcl::bn::Fp6* h : halves){
        const mcl::bn::Fp2* parts[3] = {&h->a, &h->b, &h->c};
        for(const mcl::bn::Fp2* p : parts){
            if(p->a.getLittleEndian(&out[kFpBytes*k++], kFpBytes)==0) throw std::runtime_error("Fp encode failed");
            if(p->b.getLittleEndian(&out[kFpBytes*k++], kFpBytes)==0) throw std::runtime_error("Fp encode failed");
        }
    }
    return out;
}

} // namespace curve
} // namespace commit_utility
