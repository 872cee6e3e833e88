// ============================================================================
//  File: include/g60_tables.hpp — Tables constantes G60 (DOC+)
//  Project: G60 Text Codec
//
//  CONTENU
//  -------
//  • Alphabet G60 : 60 symboles ordonnés (position = valeur de chiffre 0..59)
//      chiffres, majuscules sans 'I' ni 'O', minuscules.
//  • Table inverse symbole → valeur (256 entrées, indexée par octet).
//  • Table des longueurs partielles : n octets (1..7) → k symboles, et inverse.
//
//  GARDE-FOUS
//  ----------
//  • Tout est constexpr : aucune initialisation dynamique, aucun état mutable.
//  • kInvalid (0xFF) marque "hors alphabet" / "longueur interdite".
//  • L’ordre de l’alphabet fait partie du format : ne pas le modifier.
// ============================================================================

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace g60 {

static constexpr size_t  BLOCK_BYTES   = 8;   // octets par bloc plein
static constexpr size_t  GROUP_SYMBOLS = 11;  // symboles par groupe plein
static constexpr size_t  ALPHABET_SIZE = 60;
static constexpr uint8_t kInvalid      = 0xFF;

static constexpr char kAlphabet[ALPHABET_SIZE + 1] =
    "0123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

namespace detail {

constexpr std::array<uint8_t,256> make_symbol_values()
{
    std::array<uint8_t,256> t{};
    for(size_t i=0; i<t.size(); ++i) t[i] = kInvalid;
    for(size_t v=0; v<ALPHABET_SIZE; ++v) t[(uint8_t)kAlphabet[v]] = (uint8_t)v;
    return t;
}

} // namespace detail

// Symbole (octet ASCII) → valeur 0..59, ou kInvalid.
static constexpr std::array<uint8_t,256> kSymbolValue = detail::make_symbol_values();

// n octets → k symboles. Index 0 = pas de bloc partiel ; index 8 = bloc plein.
// k(n) = plus petit k tel que 60^k >= 2^(8n).
static constexpr std::array<uint8_t,BLOCK_BYTES + 1> kSymbolsForBytes = {
    0, 2, 3, 5, 6, 7, 9, 10, 11
};

// k symboles → n octets. Les restes 1, 4 et 8 ne sont jamais produits.
static constexpr std::array<uint8_t,GROUP_SYMBOLS + 1> kBytesForSymbols = {
    0, kInvalid, 1, 2, kInvalid, 3, 4, 5, kInvalid, 6, 7, 8
};

inline char symbol_of(uint8_t value) { return kAlphabet[value]; }

inline uint8_t value_of(char symbol) { return kSymbolValue[(uint8_t)symbol]; }

inline bool is_symbol(char c) { return kSymbolValue[(uint8_t)c] != kInvalid; }

} // namespace g60
