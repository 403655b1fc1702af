#include "tokenizer.hpp"
#include "errors.hpp"
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace textclf {

namespace {

icu::UnicodeString fromUtf8(const std::string& s) {
    // malformed sequences come back as U+FFFD, which is not a word character
    return icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
}

std::string toUtf8(const icu::UnicodeString& u) {
    std::string out;
    u.toUTF8String(out);
    return out;
}

// Python's str \w: letters, numbers and the underscore.
bool isWordChar(UChar32 c) {
    if (c == '_') return true;
    switch (u_charType(c)) {
    case U_UPPERCASE_LETTER:
    case U_LOWERCASE_LETTER:
    case U_TITLECASE_LETTER:
    case U_MODIFIER_LETTER:
    case U_OTHER_LETTER:
    case U_DECIMAL_DIGIT_NUMBER:
    case U_LETTER_NUMBER:
    case U_OTHER_NUMBER:
        return true;
    default:
        return false;
    }
}

// NFKD, then drop combining marks. Marks already present in the input go too.
icu::UnicodeString stripAccents(const icu::UnicodeString& u) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status)) {
        throw ConfigurationError(std::string("ICU NFKD normalizer unavailable: ") + u_errorName(status));
    }
    icu::UnicodeString decomposed = nfkd->normalize(u, status);
    if (U_FAILURE(status)) {
        throw ConfigurationError(std::string("ICU NFKD normalization failed: ") + u_errorName(status));
    }
    icu::UnicodeString out;
    for (int32_t i = 0; i < decomposed.length(); i = decomposed.moveIndex32(i, 1)) {
        UChar32 c = decomposed.char32At(i);
        if (u_getCombiningClass(c) == 0) out.append(c);
    }
    return out;
}

} // namespace

Tokenizer::Tokenizer() : Tokenizer(TokenizerOptions{}) {}

Tokenizer::Tokenizer(const TokenizerOptions& opts) : opts_(opts) {
    if (opts_.ngram_min < 1 || opts_.ngram_max < opts_.ngram_min) {
        throw ConfigurationError("invalid ngram range [" + std::to_string(opts_.ngram_min) +
                                 ", " + std::to_string(opts_.ngram_max) + "]");
    }
    if (opts_.min_token_chars < 1) {
        throw ConfigurationError("min_token_chars must be at least 1");
    }
}

std::string Tokenizer::normalize(const std::string& text) const {
    icu::UnicodeString u = fromUtf8(text);
    if (opts_.lowercase) u.toLower(icu::Locale::getRoot());
    if (opts_.strip_accents) u = stripAccents(u);
    return toUtf8(u);
}

std::vector<std::string> Tokenizer::words(const std::string& normalized) const {
    const icu::UnicodeString u = fromUtf8(normalized);
    std::vector<std::string> out;

    icu::UnicodeString current;
    std::size_t run = 0;   // code points, not UTF-16 units
    auto flush = [&]() {
        if (run >= opts_.min_token_chars) out.push_back(toUtf8(current));
        current.remove();
        run = 0;
    };

    for (int32_t i = 0; i < u.length(); i = u.moveIndex32(i, 1)) {
        UChar32 c = u.char32At(i);
        if (isWordChar(c)) {
            current.append(c);
            ++run;
        } else {
            flush();
        }
    }
    flush();
    return out;
}

std::vector<std::string> Tokenizer::ngrams(const std::string& text) const {
    const std::vector<std::string> toks = words(normalize(text));
    std::vector<std::string> out;
    const std::size_t n_toks = toks.size();

    for (std::size_t n = static_cast<std::size_t>(opts_.ngram_min);
         n <= static_cast<std::size_t>(opts_.ngram_max) && n <= n_toks; ++n) {
        for (std::size_t i = 0; i + n <= n_toks; ++i) {
            std::string gram = toks[i];
            for (std::size_t k = 1; k < n; ++k) {
                gram += ' ';
                gram += toks[i + k];
            }
            out.push_back(std::move(gram));
        }
    }
    return out;
}

std::string padForCues(const std::string& text) {
    icu::UnicodeString u = fromUtf8(text);
    u.toLower(icu::Locale::getRoot());
    return " " + toUtf8(u) + " ";
}

} // namespace textclf
