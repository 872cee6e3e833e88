// ============================================================================
//  File: src/minitest_g60_string.cpp — Tests G60String & génération aléatoire
//  Project: G60 Text Codec
//
//  Objectifs testés :
//   [S1] G60String : construction vérifiée, sortie intacte en cas d’échec,
//        décodage, decode_into, comparaisons, sortie flux.
//   [S2] random_* / fast_random_* / custom_* : chaînes canoniques de la
//        bonne longueur ; longueurs interdites ramenées à len-1.
//   [S3] fast_random_* avec graine : déterminisme.
// ============================================================================

#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "g60_codec.hpp"
#include "g60_random.hpp"
#include "g60_string.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using g60::G60String;

// ------------------ TEST S1 : G60String --------------------------------------
static bool test_g60string()
{
    G60String s;
    T_ASSERT( s.empty() && s.size()==0 && s.decode().empty() );

    g60::Error e;
    T_ASSERT( G60String::from_encoded("Gt4CGFiHehzRzjCF16", s, &e) );
    T_ASSERT( s.str() == "Gt4CGFiHehzRzjCF16" );
    T_ASSERT( s.size() == 18 && s.decoded_size() == 13 );
    const std::vector<uint8_t> d = s.decode();
    T_ASSERT( std::string(d.begin(), d.end()) == "Hello, world!" );

    // decode() d’une valeur vérifiée == g60::decode, toutes tailles de groupe
    for(size_t n=0; n<24; ++n){
        const std::string t = g60::fast_random_bytes(n, 1000+n);
        G60String r;
        std::vector<uint8_t> ref;
        T_ASSERT( G60String::from_encoded(t, r) && g60::decode(t, ref) );
        T_ASSERT( r.decode() == ref && ref.size() == n );
    }

    // échecs : s inchangé
    T_ASSERT( !G60String::from_encoded("Hello, world!", s, &e) );
    T_ASSERT( e.code == g60::ErrorCode::InvalidCharacter && e.index == 5 );
    T_ASSERT( !G60String::from_encoded("JKLMNPQRSTUx", s, &e) );
    T_ASSERT( e.code == g60::ErrorCode::InvalidLength );
    T_ASSERT( !G60String::from_encoded("0f", s, &e) );
    T_ASSERT( e.code == g60::ErrorCode::ValueOutOfRange );
    T_ASSERT( s.str() == "Gt4CGFiHehzRzjCF16" );

    const G60String h = G60String::encode_str("Hello, world!");
    T_ASSERT( h == s );
    T_ASSERT( !(h != s) );
    const std::vector<uint8_t> raw{0x00};
    const G60String z = G60String::encode(raw);
    T_ASSERT( z.str() == "00" );
    T_ASSERT( z < h );
    T_ASSERT( G60String::encode(raw.data(), raw.size()) == z );

    uint8_t buf[13]; size_t written=0;
    T_ASSERT( h.decode_into(buf, sizeof(buf), written, &e) && written == 13 );
    T_ASSERT( std::memcmp(buf, "Hello, world!", 13) == 0 );
    T_ASSERT( !h.decode_into(buf, 12, written, &e) );
    T_ASSERT( e.code == g60::ErrorCode::BufferTooSmall && e.required == 13 );

    std::ostringstream os; os << h;
    T_ASSERT( os.str() == "Gt4CGFiHehzRzjCF16" );
    return true;
}

// ------------------ TEST S2 : génération aléatoire ---------------------------
static bool test_random()
{
    for(size_t n=0; n<40; ++n){
        const std::string a = g60::random_bytes(n);
        const std::string b = g60::fast_random_bytes(n);
        T_ASSERT( a.size() == g60::encoded_size(n) && g60::verify(a) );
        T_ASSERT( b.size() == g60::encoded_size(n) && g60::verify(b) );
    }
    for(size_t len=0; len<60; ++len){
        const size_t expect = g60::is_valid_encoded_length(len) ? len : len-1;
        T_ASSERT( g60::floor_valid_length(len) == expect );
        const std::string a = g60::random(len);
        const std::string b = g60::fast_random(len);
        T_ASSERT( a.size() == expect && g60::verify(a) );
        T_ASSERT( b.size() == expect && g60::verify(b) );
    }

    // callback appelant : octets 0xFF partout
    size_t calls=0;
    const g60::FillFn ones = [&calls](uint8_t* p, size_t n){ ++calls; std::memset(p, 0xFF, n); };
    T_ASSERT( g60::custom_random_bytes(8, ones) == "zinqfBXiMKF" );
    T_ASSERT( g60::custom_random(12, ones) == "zinqfBXiMKF" );   // 12 → 11
    T_ASSERT( g60::custom_random(13, ones) == "zinqfBXiMKFzW" );
    T_ASSERT( calls == 3 );
    T_ASSERT( g60::custom_random_bytes(0, ones).empty() && calls == 3 );
    return true;
}

// ------------------ TEST S3 : graine -----------------------------------------
static bool test_seeded()
{
    T_ASSERT( g60::fast_random_bytes(100, 42) == g60::fast_random_bytes(100, 42) );
    T_ASSERT( g60::fast_random_bytes(100, 42) != g60::fast_random_bytes(100, 43) );
    T_ASSERT( g60::fast_random(30, 7) == g60::fast_random(30, 7) );
    T_ASSERT( g60::fast_random(30, 7).size() == 29 );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_g60string();
    std::cout << "[S1] G60String : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_random();
    std::cout << "[S2] random : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_seeded();
    std::cout << "[S3] seeded : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
