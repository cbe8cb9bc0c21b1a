/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * encoding_transformer.cpp - Encoding evasion variants
 *
 * Character rules:
 *   u  c -> %XX
 *   d  c -> %25XX
 *   b  c -> %u00XX
 *   o  c -> %C0|(c>>6) %80|(c&0x3f)       (two byte overlong, ASCII)
 *        c -> %E0 %80|(c>>6) %80|(c&0x3f)  (three byte overlong, c >= 0x80)
 *
 * Alternate forms:
 *   b  lookalike              / -> %u2215, \ -> %u2216, rest as form 0
 *   o  three byte overlong    c -> %E0 %80|(c>>6) %80|(c&0x3f)
 *   o  invalid continuation   c -> %C0 %XX          (ASCII)
 *                             c -> %E0 %80 %XX      (c >= 0x80)
 */

#include "encoding_transformer.hpp"
#include "../../common/errors.hpp"

namespace lfichef {
namespace encoding {

namespace {

const char* kHex = "0123456789abcdef";

void appendHexByte(std::string& out, unsigned int byte) {
    out += '%';
    out += kHex[(byte >> 4) & 0xF];
    out += kHex[byte & 0xF];
}

} // namespace

EncodingSet parseEncodingSet(const std::string& input) {
    EncodingSet set;

    for (char c : input) {
        Encoding technique;
        switch (c) {
            case 'u': technique = Encoding::Url; break;
            case 'd': technique = Encoding::DoubleUrl; break;
            case 'b': technique = Encoding::Unicode16; break;
            case 'o': technique = Encoding::OverlongUtf8; break;
            default:
                throw LfiChefError(ErrorKind::UnknownEncodingToken,
                                   std::string("Unknown encoding \"") + c + "\" in \"" + input +
                                   "\" (available: u, d, b, o)");
        }

        if (!set.contains(technique)) {
            set.techniques.push_back(technique);
        }
    }

    return set;
}

void EncodingTransformer::configure(const EncodingConfig& config) {
    config_ = config;
    buildChains();
    logger_.debug("encodings '{}' -> {} chain(s), {} variant(s){}", config_.set.toString(),
                  chains_.size(), variantCount(),
                  config_.alternate_forms ? " with alternate forms" : "");
}

void EncodingTransformer::buildChains() {
    chains_.clear();

    const auto& techniques = config_.set.techniques;
    const size_t n = techniques.size();

    // combinations of each size k, lexicographic over option positions
    for (size_t k = 1; k <= n; k++) {
        std::vector<size_t> idx(k);
        for (size_t i = 0; i < k; i++) idx[i] = i;

        while (true) {
            std::vector<Encoding> chain;
            chain.reserve(k);
            for (size_t i : idx) {
                chain.push_back(techniques[i]);
            }
            chains_.push_back(std::move(chain));

            size_t pos = k;
            while (pos > 0 && idx[pos - 1] == n - k + pos - 1) {
                pos--;
            }
            if (pos == 0) break;

            idx[pos - 1]++;
            for (size_t j = pos; j < k; j++) {
                idx[j] = idx[j - 1] + 1;
            }
        }
    }
}

size_t EncodingTransformer::variantCount() const {
    size_t total = 0;
    for (const auto& chain : chains_) {
        size_t per_chain = 1;
        for (Encoding technique : chain) {
            per_chain *= static_cast<size_t>(formsFor(technique));
        }
        total += per_chain;
    }
    return total;
}

std::string EncodingTransformer::encodeChar(Encoding technique, unsigned char c, int form) {
    std::string out;

    switch (technique) {
        case Encoding::Url:
            appendHexByte(out, c);
            break;
        case Encoding::DoubleUrl:
            out = "%25";
            out += kHex[(c >> 4) & 0xF];
            out += kHex[c & 0xF];
            break;
        case Encoding::Unicode16:
            if (form == 1 && c == '/') {
                out = "%u2215";
                break;
            }
            if (form == 1 && c == '\\') {
                out = "%u2216";
                break;
            }
            out = "%u00";
            out += kHex[(c >> 4) & 0xF];
            out += kHex[c & 0xF];
            break;
        case Encoding::OverlongUtf8:
            if (form == 2) {
                if (c < 0x80) {
                    appendHexByte(out, 0xC0);
                } else {
                    appendHexByte(out, 0xE0);
                    appendHexByte(out, 0x80);
                }
                appendHexByte(out, c);
            } else if (c < 0x80 && form == 0) {
                appendHexByte(out, 0xC0 | (c >> 6));
                appendHexByte(out, 0x80 | (c & 0x3F));
            } else {
                appendHexByte(out, 0xE0);
                appendHexByte(out, 0x80 | (c >> 6));
                appendHexByte(out, 0x80 | (c & 0x3F));
            }
            break;
    }

    return out;
}

bool EncodingTransformer::shouldEncode(unsigned char c, bool include_percent) const {
    if (config_.scope == EncodeScope::All) {
        return true;
    }

    switch (c) {
        case '/':
        case '\\':
        case '.':
            return true;
        case ':':
            return config_.os == TargetOS::Windows;
        case '%':
            return include_percent;
        default:
            return false;
    }
}

std::string EncodingTransformer::applyTechnique(Encoding technique,
                                                const std::string& input,
                                                bool include_percent,
                                                int form) const {
    std::string out;
    out.reserve(input.size() * 2);

    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (shouldEncode(c, include_percent)) {
            out += encodeChar(technique, c, form);
        } else {
            out += ch;
        }
    }

    return out;
}

VariantList EncodingTransformer::transform(const std::string& path) const {
    if (chains_.empty()) {
        return {path};
    }

    VariantList variants;
    variants.reserve(variantCount());

    for (const auto& chain : chains_) {
        std::vector<int> forms(chain.size(), 0);

        while (true) {
            std::string current = path;
            bool chained = false;
            for (size_t i = 0; i < chain.size(); i++) {
                current = applyTechnique(chain[i], current, chained, forms[i]);
                chained = true;
            }
            variants.push_back(std::move(current));

            // next form combination, last technique fastest
            size_t pos = chain.size();
            while (pos > 0 && forms[pos - 1] + 1 >= formsFor(chain[pos - 1])) {
                forms[pos - 1] = 0;
                pos--;
            }
            if (pos == 0) break;
            forms[pos - 1]++;
        }
    }

    return variants;
}

VariantList EncodingTransformer::mutate(const std::string& payload) {
    if (!isActive()) {
        return {};
    }

    VariantList variants = transform(payload);
    incrementStat("payloads_in");
    incrementStat("variants", static_cast<long long>(variants.size()));
    return variants;
}

} // namespace encoding
} // namespace lfichef
