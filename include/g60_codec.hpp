// ============================================================================
//  File: include/g60_codec.hpp — Codec G60 octets ↔ texte (DOC+)
//  Project: G60 Text Codec
//
//  FORMAT
//  ------
//  • Entrée découpée en blocs de 8 octets ; le dernier peut être partiel (1..7).
//  • Bloc plein → 11 symboles ; bloc partiel de n octets → k(n) symboles
//    (voir g60_tables.hpp : 2,3,5,6,7,9,10). Expansion 11/8 = 37,5 %.
//  • Chiffres d’un groupe : disposition mixte fixe (14·a + b/20, 3·(b%20) + c/90,
//    ...) où chaque frontière de chiffre tombe de sorte que les k(n) premiers
//    chiffres ne dépendent que des n premiers octets. Un bloc partiel est
//    complété à droite par des zéros puis tronqué à k(n) chiffres.
//  • Décodage strict : seule une chaîne produite par encode() est acceptée
//    (forme canonique). Toute autre combinaison de symboles est rejetée.
//
//  ERREURS
//  -------
//  • Les fonctions qui peuvent échouer renvoient bool et remplissent un
//    Error* optionnel. En cas d’échec la sortie de l’appelant n’est PAS touchée.
//  • encode() ne peut pas échouer.
//
//  API
//  ---
//   std::string encode(const std::vector<uint8_t>& bytes);
//   bool        decode(const std::string& text, std::vector<uint8_t>& out, Error* err);
//   std::string encode_str(const std::string& text);
//   bool        decode_to_string(const std::string& text, std::string& out, Error* err);
//   bool        encode_into(in, n, out, cap, written, err);
//   bool        decode_into(text, out, cap, written, err);
//   bool        verify(const std::string& text, Error* err);
//   bool        canonicalize(const std::string& text, std::string& out, Error* err);
//
//  EXEMPLE
//  -------
//   std::string s = g60::encode_str("Hello, world!");   // "Gt4CGFiHehzRzjCF16"
//   std::string back; g60::Error e;
//   if(!g60::decode_to_string(s, back, &e)) std::cerr << e.message() << "\n";
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "g60_tables.hpp"

#define G60_VERSION_MAJOR 1
#define G60_VERSION_MINOR 0
#define G60_VERSION_PATCH 0
#define G60_VERSION_STRING "1.0.0"

namespace g60 {

// ================================ Erreurs ===================================

enum class ErrorCode : uint8_t {
    None             = 0,
    InvalidCharacter = 1,  // caractère hors alphabet
    InvalidLength    = 2,  // reste final ∉ {0,2,3,5,6,7,9,10}
    ValueOutOfRange  = 3,  // groupe bien formé mais non canonique
    InvalidText      = 4,  // decode_to_string : octets non UTF-8
    BufferTooSmall   = 5   // encode_into / decode_into
};

struct Error {
    ErrorCode code = ErrorCode::None;
    size_t  index = 0;     // position du caractère, du début de groupe ou de l’octet fautif
    uint8_t byte  = 0;     // InvalidCharacter : caractère fautif
    size_t  actual   = 0;  // InvalidLength : longueur reçue ; BufferTooSmall : capacité
    size_t  required = 0;  // BufferTooSmall : taille requise

    explicit operator bool() const { return code != ErrorCode::None; }
    std::string message() const;
};

const char* error_name(ErrorCode code);

// ================================ Tailles ===================================

// Longueur exacte de encode() pour n octets : 11·(n/8) + k(n%8).
size_t encoded_size(size_t n_bytes);

// Nombre d’octets décodés pour une longueur encodée valide : floor(8·n/11).
size_t decoded_size(size_t n_symbols);

bool is_valid_encoded_length(size_t n_symbols);

// =============================== Encodage ===================================

std::string encode(const uint8_t* data, size_t n);
std::string encode(const std::vector<uint8_t>& bytes);

// Encode les octets bruts de `text`.
std::string encode_str(const std::string& text);

// Écrit encoded_size(n) symboles dans `out`. Rien n’est écrit si cap est trop petit.
bool encode_into(const uint8_t* data, size_t n,
                 char* out, size_t cap,
                 size_t& written,
                 Error* err = nullptr);

// =============================== Décodage ===================================

bool decode(const std::string& text,
            std::vector<uint8_t>& out,
            Error* err = nullptr);

// Comme decode(), puis valide que les octets forment un texte UTF-8 correct.
bool decode_to_string(const std::string& text,
                      std::string& out,
                      Error* err = nullptr);

// L’entrée est entièrement validée avant le contrôle de capacité.
bool decode_into(const std::string& text,
                 uint8_t* out, size_t cap,
                 size_t& written,
                 Error* err = nullptr);

// ============================= Vérification =================================

// Validation complète (alphabet, longueur, canonicité) sans produire de sortie.
bool verify(const std::string& text, Error* err = nullptr);

inline bool is_canonical(const std::string& text) { return verify(text); }

// Forme canonique d’un texte bien formé (alphabet et longueur valides) :
// décodage permissif (chaque valeur d’octet réduite modulo 256, bourrage
// ignoré) puis ré-encodage. Un texte canonique est renvoyé tel quel.
// Échoue seulement sur InvalidCharacter / InvalidLength.
bool canonicalize(const std::string& text, std::string& out, Error* err = nullptr);

} // namespace g60
