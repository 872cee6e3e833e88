// ============================================================================
//  File: include/g60_utf8.hpp — Validation UTF-8 stricte (RFC 3629)
//  Project: G60 Text Codec
//
//  • Refuse : octets de continuation isolés, séquences tronquées, formes
//    sur-longues, surrogates U+D800..U+DFFF, points de code > U+10FFFF.
//  • Utilisé par decode_to_string() ; aucune allocation.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>

namespace g60 {

// Renvoie true si [p, p+n) est de l’UTF-8 bien formé. Sinon `bad_index`
// (optionnel) reçoit la position du premier octet de la séquence fautive.
inline bool utf8_valid(const uint8_t* p, size_t n, size_t* bad_index = nullptr)
{
    size_t i=0;
    while(i<n){
        const uint8_t c = p[i];
        if(c < 0x80){ ++i; continue; }

        size_t len=0; uint8_t lo=0x80, hi=0xBF;
        if(c>=0xC2 && c<=0xDF)      { len=2; }
        else if(c==0xE0)            { len=3; lo=0xA0; }
        else if(c==0xED)            { len=3; hi=0x9F; }  // pas de surrogates
        else if(c>=0xE1 && c<=0xEF) { len=3; }
        else if(c==0xF0)            { len=4; lo=0x90; }
        else if(c>=0xF1 && c<=0xF3) { len=4; }
        else if(c==0xF4)            { len=4; hi=0x8F; }  // <= U+10FFFF
        else { if(bad_index) *bad_index=i; return false; }

        if(n-i < len){ if(bad_index) *bad_index=i; return false; }
        // Le 2e octet porte la contrainte lo/hi, les suivants 0x80..0xBF.
        if(p[i+1]<lo || p[i+1]>hi){ if(bad_index) *bad_index=i; return false; }
        for(size_t k=2;k<len;++k){
            if((p[i+k] & 0xC0) != 0x80){ if(bad_index) *bad_index=i; return false; }
        }
        i += len;
    }
    return true;
}

} // namespace g60
