// ============================================================================
//  File: src/minitest_codec.cpp — Mini-tests codec G60
//  Project: G60 Text Codec
//
//  Objectifs testés :
//   [A] Vecteurs de référence (Hello, world!, zéros, 0xFF, UTF-8).
//   [B] Round-trip octets / texte sur données pseudo-aléatoires (graine fixe).
//   [C] Loi de longueur + fermeture sur l’alphabet.
//   [D] Injectivité (exhaustive sur 0..2 octets) et monotonie de l’encodage.
//   [E] Rejets : InvalidCharacter, InvalidLength, ValueOutOfRange, InvalidText.
//   [F] Canonicité : exactement 256^n groupes valides pour n = 1, 2.
//   [G] encode_into / decode_into : capacité, sortie intacte en cas d’échec.
//   [H] canonicalize : réparation des groupes non canoniques, idempotence.
//
//  Exécution :
//    ./minitest_codec  -> code retour 0 si tout passe
// ============================================================================

#include <cstdint>
#include <cstring>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "g60_codec.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static std::vector<uint8_t> bytes_of(const std::string& s){ return std::vector<uint8_t>(s.begin(), s.end()); }

static std::mt19937_64& rng()
{
    static std::mt19937_64 gen(0x60600606ull);
    return gen;
}
static std::vector<uint8_t> random_vector(size_t n)
{
    std::uniform_int_distribution<int> d(0, 255);
    std::vector<uint8_t> v(n);
    for(auto& b: v) b=(uint8_t)d(rng());
    return v;
}

// Décode et attend un échec `code` à `index`.
static bool expect_decode_error(const std::string& text, g60::ErrorCode code, size_t index)
{
    std::vector<uint8_t> out{0x42};
    g60::Error e;
    if(g60::decode(text, out, &e)) return false;
    if(e.code!=code || e.index!=index) return false;
    if(out.size()!=1 || out[0]!=0x42) return false;      // sortie intacte
    g60::Error v;
    if(g60::verify(text, &v) || v.code!=code || v.index!=index) return false;
    return !g60::is_canonical(text);
}

// ------------------ TEST A : vecteurs ----------------------------------------
static bool test_vectors()
{
    const std::string hello = "Hello, world!";
    T_ASSERT( g60::encode(bytes_of(hello)) == "Gt4CGFiHehzRzjCF16" );
    T_ASSERT( g60::encode_str(hello) == "Gt4CGFiHehzRzjCF16" );

    std::vector<uint8_t> out;
    T_ASSERT( g60::decode("Gt4CGFiHehzRzjCF16", out) );
    T_ASSERT( out == bytes_of(hello) );
    std::string s;
    T_ASSERT( g60::decode_to_string("Gt4CGFiHehzRzjCF16", s) );
    T_ASSERT( s == hello );

    T_ASSERT( g60::encode(std::vector<uint8_t>{0x00}) == "00" );
    T_ASSERT( g60::encode(std::vector<uint8_t>{0x01}) == "0E" );
    T_ASSERT( g60::encode(std::vector<uint8_t>{0xFF}) == "zW" );
    T_ASSERT( g60::encode(std::vector<uint8_t>{0x12,0x34,0x56}) == "4EcxL" );
    T_ASSERT( g60::encode(std::vector<uint8_t>(8, 0xFF)) == "zinqfBXiMKF" );
    T_ASSERT( g60::encode(std::vector<uint8_t>(9, 0x00)) == "0000000000000" );
    T_ASSERT( g60::encode_str("Hello") == "Gt4CGFi" );
    T_ASSERT( g60::encode_str("abcdefgh") == "Niv6F3Ngwck" );
    T_ASSERT( g60::encode_str("The quick brown fox") == "KhD7QrmmwmfQzd5d9inlAYPtaL0" );
    T_ASSERT( g60::encode_str("h\xC3\xA9llo") == "QRmswFckQ" );

    std::vector<uint8_t> seq; for(int i=1;i<=16;++i) seq.push_back((uint8_t)i);
    T_ASSERT( g60::encode(seq) == "0E620cA2Qb826W7MoS5dFG" );
    T_ASSERT( g60::decode("0E620cA2Qb826W7MoS5dFG", out) && out == seq );

    T_ASSERT( g60::decode("34564657567", out) );
    T_ASSERT( (out == std::vector<uint8_t>{0x0D,0x29,0xBD,0x1B,0x5C,0xA7,0xCD,0x43}) );
    T_ASSERT( g60::decode("010", out) && (out == std::vector<uint8_t>{0x00,0x14}) );

    // vide
    T_ASSERT( g60::encode(std::vector<uint8_t>{}).empty() );
    T_ASSERT( g60::encode_str("").empty() );
    out.assign(3, 7);
    T_ASSERT( g60::decode("", out) && out.empty() );
    s = "x";
    T_ASSERT( g60::decode_to_string("", s) && s.empty() );
    return true;
}

// ------------------ TEST B : round-trip --------------------------------------
static bool test_roundtrip()
{
    for(size_t n=0; n<=64; ++n){
        for(int it=0; it<40; ++it){
            const std::vector<uint8_t> v = random_vector(n);
            const std::string enc = g60::encode(v);
            std::vector<uint8_t> back;
            g60::Error e;
            T_ASSERT( g60::decode(enc, back, &e) );
            T_ASSERT( back == v );
            T_ASSERT( g60::verify(enc) );
        }
    }
    // blocs uniformes, tous octets
    for(size_t n=0; n<16; ++n){
        for(int b=0; b<256; ++b){
            const std::vector<uint8_t> v(n, (uint8_t)b);
            std::vector<uint8_t> back;
            T_ASSERT( g60::decode(g60::encode(v), back) && back == v );
        }
    }
    // texte UTF-8
    const char* texts[] = { "", "a", "G60", "Hello, world!", "h\xC3\xA9llo w\xC3\xB6rld",
                            "\xE2\x82\xAC 12,50", "\xF0\x9F\x98\x80 emoji", "line1\nline2\t\x7F" };
    for(const char* t: texts){
        std::string back;
        T_ASSERT( g60::decode_to_string(g60::encode_str(t), back) );
        T_ASSERT( back == t );
    }
    return true;
}

// ------------------ TEST C : longueur & alphabet -----------------------------
static bool test_length_and_closure()
{
    static const size_t k[8] = {0,2,3,5,6,7,9,10};
    for(size_t n=0; n<=100; ++n){
        const std::string enc = g60::encode(random_vector(n));
        T_ASSERT( enc.size() == 11*(n/8) + k[n%8] );
        T_ASSERT( enc.size() == g60::encoded_size(n) );
        for(char c: enc) T_ASSERT( g60::is_symbol(c) );
    }
    return true;
}

// ------------------ TEST D : injectivité & monotonie -------------------------
static bool test_injective_monotonic()
{
    std::set<std::string> seen;
    T_ASSERT( seen.insert(g60::encode(std::vector<uint8_t>{})).second );
    for(int a=0; a<256; ++a)
        T_ASSERT( seen.insert(g60::encode(std::vector<uint8_t>{(uint8_t)a})).second );
    for(int a=0; a<256; ++a)
        for(int b=0; b<256; ++b)
            T_ASSERT( seen.insert(g60::encode(std::vector<uint8_t>{(uint8_t)a,(uint8_t)b})).second );
    T_ASSERT( seen.size() == 1 + 256 + 65536 );

    // 1 octet : strictement croissant
    for(int cur=1; cur<256; ++cur)
        T_ASSERT( g60::encode(std::vector<uint8_t>{(uint8_t)(cur-1)}) < g60::encode(std::vector<uint8_t>{(uint8_t)cur}) );

    // 2 octets puis 9 octets (2e bloc) : le premier octet domine
    for(int cur=1; cur<256; ++cur){
        for(int ps=0; ps<256; ps+=17){
            for(int cs=0; cs<256; cs+=15){
                const std::string p2 = g60::encode(std::vector<uint8_t>{(uint8_t)(cur-1),(uint8_t)ps});
                const std::string c2 = g60::encode(std::vector<uint8_t>{(uint8_t)cur,(uint8_t)cs});
                T_ASSERT( p2 < c2 );
                const std::string p9 = g60::encode(std::vector<uint8_t>{(uint8_t)(cur-1),0,0,0,0,0,0,0,(uint8_t)ps});
                const std::string c9 = g60::encode(std::vector<uint8_t>{(uint8_t)cur,0,0,0,0,0,0,0,(uint8_t)cs});
                T_ASSERT( p9 < c9 );
            }
        }
    }
    return true;
}

// ------------------ TEST E : rejets ------------------------------------------
static bool test_rejections()
{
    using g60::ErrorCode;

    // caractères hors alphabet
    T_ASSERT( expect_decode_error("Hello, world!", ErrorCode::InvalidCharacter, 5) );
    T_ASSERT( expect_decode_error("THIS IS A TEST", ErrorCode::InvalidCharacter, 2) );
    T_ASSERT( expect_decode_error("TESTONTEST", ErrorCode::InvalidCharacter, 4) );
    T_ASSERT( expect_decode_error("Gt4CGFiHehzRzjCF1=", ErrorCode::InvalidCharacter, 17) );
    T_ASSERT( expect_decode_error(std::string("00\0", 3), ErrorCode::InvalidCharacter, 2) );
    {
        g60::Error e; std::vector<uint8_t> out;
        T_ASSERT( !g60::decode("ab-c", out, &e) );
        T_ASSERT( e.byte == '-' );
        T_ASSERT( e.message().find("InvalidCharacter") != std::string::npos );
    }
    // le contrôle des caractères précède celui de la longueur
    T_ASSERT( expect_decode_error("I", ErrorCode::InvalidCharacter, 0) );

    // longueurs : restes 1, 4, 8
    T_ASSERT( expect_decode_error("0", ErrorCode::InvalidLength, 0) );
    T_ASSERT( expect_decode_error("JKLMNPQRSTUx", ErrorCode::InvalidLength, 11) );
    T_ASSERT( expect_decode_error("JKLMNPQRSTUxxxx", ErrorCode::InvalidLength, 11) );
    T_ASSERT( expect_decode_error("JKLMNPQRSTUxxxxxxxx", ErrorCode::InvalidLength, 11) );
    T_ASSERT( expect_decode_error("0000", ErrorCode::InvalidLength, 0) );
    {
        g60::Error e; std::vector<uint8_t> out;
        T_ASSERT( !g60::decode(std::string(12, '0'), out, &e) );
        T_ASSERT( e.code == ErrorCode::InvalidLength && e.actual == 12 );
    }

    // groupes non canoniques
    const char* partial[] = { "0f", "2F", "5y", "BU", "Gv", "Nr", "Xd", "zX", "zz", "0z", "00z" };
    for(const char* t: partial) T_ASSERT( expect_decode_error(t, ErrorCode::ValueOutOfRange, 0) );
    T_ASSERT( expect_decode_error("zzzzzzzzzzz", ErrorCode::ValueOutOfRange, 0) );
    T_ASSERT( expect_decode_error("zinqfBXiMKG", ErrorCode::ValueOutOfRange, 0) );  // 2^64
    T_ASSERT( expect_decode_error("0Co00000000", ErrorCode::ValueOutOfRange, 0) );
    T_ASSERT( expect_decode_error("u4KyKnAScG8", ErrorCode::ValueOutOfRange, 0) );  // octets < 256 mais non canonique
    T_ASSERT( expect_decode_error("Gt4CGFiHehzzX", ErrorCode::ValueOutOfRange, 11) );
    T_ASSERT( expect_decode_error("Gt4CGFiHehz0f", ErrorCode::ValueOutOfRange, 11) );
    T_ASSERT( expect_decode_error("zzzzzzzzzzzGt4CGFiHehz", ErrorCode::ValueOutOfRange, 0) );

    // décodage OK mais texte non UTF-8
    {
        const std::string bad = g60::encode(std::vector<uint8_t>{0xC3,0x28});
        T_ASSERT( bad == "lY0" );
        std::vector<uint8_t> raw;
        T_ASSERT( g60::decode(bad, raw) );
        std::string s = "keep";
        g60::Error e;
        T_ASSERT( !g60::decode_to_string(bad, s, &e) );
        T_ASSERT( e.code == ErrorCode::InvalidText && e.index == 0 );
        T_ASSERT( s == "keep" );

        const std::vector<std::vector<uint8_t>> invalid = {
            {0x80}, {0xC0,0xAF}, {0xE0,0x80,0xAF}, {0xED,0xA0,0x80},
            {0xF4,0x90,0x80,0x80}, {0xF8,0x88,0x80,0x80,0x80}, {'o','k',0xE2,0x82} };
        for(const auto& v: invalid) T_ASSERT( !g60::decode_to_string(g60::encode(v), s, &e) && e.code==ErrorCode::InvalidText );
        T_ASSERT( e.index == 2 );
    }
    return true;
}

// ------------------ TEST F : canonicité exhaustive ---------------------------
static bool test_canonical_counts()
{
    const std::string A = g60::kAlphabet;

    size_t ok1=0;
    for(char a: A) for(char b: A){
        const std::string t{a,b};
        if(g60::verify(t)){
            ++ok1;
            std::vector<uint8_t> v;
            T_ASSERT( g60::decode(t, v) && g60::encode(v) == t );
        }
    }
    T_ASSERT( ok1 == 256 );

    size_t ok2=0;
    std::string t(3, '0');
    for(char a: A) for(char b: A) for(char c: A){
        t[0]=a; t[1]=b; t[2]=c;
        if(g60::verify(t)) ++ok2;
    }
    T_ASSERT( ok2 == 65536 );
    return true;
}

// ------------------ TEST G : tampons appelant --------------------------------
static bool test_buffers()
{
    const std::string hello = "Hello, world!";
    const std::vector<uint8_t> hb = bytes_of(hello);
    size_t written=0;
    g60::Error e;

    char small[15]; std::memset(small, '#', sizeof(small));
    T_ASSERT( !g60::encode_into(hb.data(), hb.size(), small, sizeof(small), written, &e) );
    T_ASSERT( e.code == g60::ErrorCode::BufferTooSmall && e.actual == 15 && e.required == 18 );
    for(char c: small) T_ASSERT( c == '#' );

    char big[20]; std::memset(big, '#', sizeof(big));
    T_ASSERT( g60::encode_into(hb.data(), hb.size(), big, sizeof(big), written, &e) );
    T_ASSERT( written == 18 );
    T_ASSERT( std::string(big, 18) == "Gt4CGFiHehzRzjCF16" );
    T_ASSERT( big[18] == '#' && big[19] == '#' );

    T_ASSERT( g60::encode_into(nullptr, 0, nullptr, 0, written) && written == 0 );

    uint8_t d10[10]; std::memset(d10, 0xAA, sizeof(d10));
    T_ASSERT( !g60::decode_into("Gt4CGFiHehzRzjCF16", d10, sizeof(d10), written, &e) );
    T_ASSERT( e.code == g60::ErrorCode::BufferTooSmall && e.actual == 10 && e.required == 13 );
    for(uint8_t b: d10) T_ASSERT( b == 0xAA );

    uint8_t d15[15]; std::memset(d15, 0xAA, sizeof(d15));
    T_ASSERT( g60::decode_into("Gt4CGFiHehzRzjCF16", d15, sizeof(d15), written, &e) );
    T_ASSERT( written == 13 );
    T_ASSERT( std::memcmp(d15, hello.data(), 13) == 0 );
    T_ASSERT( d15[13] == 0xAA && d15[14] == 0xAA );

    // entrée invalide : erreur d’entrée prioritaire sur la capacité
    T_ASSERT( !g60::decode_into("zX", d10, 0, written, &e) );
    T_ASSERT( e.code == g60::ErrorCode::ValueOutOfRange );
    return true;
}

// ------------------ TEST H : canonicalize ------------------------------------
static bool test_canonicalize()
{
    std::string out;
    g60::Error e;

    T_ASSERT( g60::canonicalize("001", out, &e) && out == "000" );
    T_ASSERT( g60::canonicalize("0Co00000000", out, &e) && out == "00000000000" );
    T_ASSERT( g60::canonicalize("0f", out) && out == "0U" );
    T_ASSERT( g60::canonicalize("zX", out) && out == "zW" );
    T_ASSERT( g60::canonicalize("zz", out) && out == "0E" );
    T_ASSERT( g60::canonicalize("u4KyKnAScG8", out) && out == "u4KyLbAScG8" );
    T_ASSERT( g60::canonicalize("", out) && out.empty() );

    // texte déjà canonique : inchangé
    T_ASSERT( g60::canonicalize("Gt4CGFiHehzRzjCF16", out) && out == "Gt4CGFiHehzRzjCF16" );
    T_ASSERT( g60::canonicalize("34564657567", out) && out == "34564657567" );

    // toute chaîne de 2 ou 3 symboles : résultat canonique, de même longueur,
    // idempotent, et égal à l’entrée si celle-ci l’est déjà
    const std::string A = g60::kAlphabet;
    for(char a: A) for(char b: A) for(char c: {'0','U','z'}){
        for(const std::string t: {std::string{a,b}, std::string{a,b,c}}){
            T_ASSERT( g60::canonicalize(t, out) );
            T_ASSERT( out.size() == t.size() && g60::verify(out) );
            if(g60::verify(t)) T_ASSERT( out == t );
            std::string again;
            T_ASSERT( g60::canonicalize(out, again) && again == out );
        }
    }

    // erreurs structurelles : sortie intacte
    out = "keep";
    T_ASSERT( !g60::canonicalize("0I", out, &e) );
    T_ASSERT( e.code == g60::ErrorCode::InvalidCharacter && e.index == 1 );
    T_ASSERT( !g60::canonicalize("0000", out, &e) );
    T_ASSERT( e.code == g60::ErrorCode::InvalidLength && e.actual == 4 );
    T_ASSERT( out == "keep" );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_vectors();
    std::cout << "[A] vectors : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_roundtrip();
    std::cout << "[B] roundtrip : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_length_and_closure();
    std::cout << "[C] length law / alphabet : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_injective_monotonic();
    std::cout << "[D] injective / monotonic : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_rejections();
    std::cout << "[E] rejections : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_canonical_counts();
    std::cout << "[F] canonical counts : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_buffers();
    std::cout << "[G] caller buffers : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_canonicalize();
    std::cout << "[H] canonicalize : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
