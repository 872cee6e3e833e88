// ============================================================================
//  File: src/minitest_tables.cpp — Tests des tables constantes G60
//  Project: G60 Text Codec
//
//  Objectifs testés :
//   [T1] Alphabet : 60 symboles distincts, bijection valeur ↔ symbole,
//        'I' et 'O' absents, ordre ASCII croissant.
//   [T2] Longueurs partielles : k(n) = plus petit k tel que 60^k >= 2^(8n),
//        recalculé exactement (entiers 64 bits) pour n = 1..8.
//   [T3] Table inverse k → n, et longueurs interdites {1,4,8}.
//   [T4] encoded_size / decoded_size contre ceil(11n/8) et floor(8n/11).
//
//  Exécution :
//    ./minitest_tables  -> code retour 0 si tout passe
// ============================================================================

#include <cstdint>
#include <iostream>
#include <set>

#include "g60_codec.hpp"
#include "g60_tables.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace g60;

// 60^k >= 2^(8n)  <=>  15^k >= 2^(8n-2k)   (valable si 8n-2k <= 63)
static bool covers(unsigned k, unsigned n)
{
    if(2*k >= 8*n) return true;
    uint64_t p15=1; for(unsigned i=0;i<k;++i) p15*=15;
    return p15 >= (uint64_t(1) << (8*n - 2*k));
}

// ------------------ TEST 1 : alphabet ---------------------------------------
static bool test_alphabet()
{
    std::set<char> seen;
    for(size_t v=0; v<ALPHABET_SIZE; ++v){
        const char c = kAlphabet[v];
        T_ASSERT( seen.insert(c).second );
        T_ASSERT( value_of(c) == v );
        T_ASSERT( symbol_of((uint8_t)v) == c );
        if(v>0) T_ASSERT( kAlphabet[v-1] < c );
    }
    T_ASSERT( seen.size() == 60 );
    T_ASSERT( kAlphabet[ALPHABET_SIZE] == '\0' );

    size_t members=0;
    for(int b=0; b<256; ++b){
        if(kSymbolValue[(size_t)b] != kInvalid){
            ++members;
            T_ASSERT( kAlphabet[kSymbolValue[(size_t)b]] == (char)b );
        }
    }
    T_ASSERT( members == 60 );
    T_ASSERT( !is_symbol('I') && !is_symbol('O') );
    T_ASSERT( !is_symbol(' ') && !is_symbol('+') && !is_symbol('/') && !is_symbol('=') );
    T_ASSERT( value_of('0')==0 && value_of('H')==17 && value_of('J')==18 && value_of('z')==59 );
    return true;
}

// ------------------ TEST 2 : k(n) minimal ------------------------------------
static bool test_partial_lengths()
{
    T_ASSERT( kSymbolsForBytes[0] == 0 );
    for(unsigned n=1; n<=BLOCK_BYTES; ++n){
        unsigned k=1; while(!covers(k,n)) ++k;
        T_ASSERT( kSymbolsForBytes[n] == k );
    }
    T_ASSERT( kSymbolsForBytes[BLOCK_BYTES] == GROUP_SYMBOLS );
    return true;
}

// ------------------ TEST 3 : inverse & longueurs interdites -------------------
static bool test_inverse_table()
{
    size_t valid=0;
    for(size_t k=0; k<=GROUP_SYMBOLS; ++k){
        const uint8_t n = kBytesForSymbols[k];
        if(n == kInvalid) continue;
        ++valid;
        T_ASSERT( kSymbolsForBytes[n] == k );
    }
    T_ASSERT( valid == 9 ); // 0 + 7 partiels + plein
    T_ASSERT( kBytesForSymbols[1]==kInvalid && kBytesForSymbols[4]==kInvalid && kBytesForSymbols[8]==kInvalid );

    for(size_t len=0; len<200; ++len){
        const size_t r = len % GROUP_SYMBOLS;
        const bool forbidden = (r==1 || r==4 || r==8);
        T_ASSERT( is_valid_encoded_length(len) == !forbidden );
    }
    return true;
}

// ------------------ TEST 4 : tailles -----------------------------------------
static bool test_sizes()
{
    for(size_t n=0; n<200; ++n){
        T_ASSERT( encoded_size(n) == (11*n + 7)/8 );
        T_ASSERT( decoded_size(encoded_size(n)) == n );
    }
    for(size_t len=0; len<200; ++len){
        T_ASSERT( decoded_size(len) == (8*len)/11 );
        if(is_valid_encoded_length(len)) T_ASSERT( encoded_size(decoded_size(len)) == len );
    }
    T_ASSERT( encoded_size(13) == 18 );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_alphabet();
    std::cout << "[1] alphabet : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_partial_lengths();
    std::cout << "[2] partial lengths : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_inverse_table();
    std::cout << "[3] inverse table : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_sizes();
    std::cout << "[4] sizes : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
