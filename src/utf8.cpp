#include "utf8.hpp"

namespace grep {

static bool is_continuation(unsigned char b)
{
    return (b & 0xC0) == 0x80;
}

std::u32string decode_utf8(const std::string& text)
{
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    const size_t n = text.size();

    while(i < n)
    {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;

        if(lead < 0x80) { out.push_back(lead); i++; continue; }
        else if((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; min_cp = 0x80; }
        else if((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; min_cp = 0x800; }
        else if((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; min_cp = 0x10000; }
        else { out.push_back(REPLACEMENT_CHAR); i++; continue; }

        if(i + len > n)
        {
            out.push_back(REPLACEMENT_CHAR);
            i++;
            continue;
        }

        bool ok = true;
        for(size_t k = 1; k < len; ++k)
        {
            unsigned char b = static_cast<unsigned char>(text[i + k]);
            if(!is_continuation(b)) { ok = false; break; }
            cp = (cp << 6) | (b & 0x3F);
        }
        // overlong forms, surrogates and out-of-range values are rejected
        if(ok && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) ok = false;

        if(!ok)
        {
            out.push_back(REPLACEMENT_CHAR);
            i++;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encode_utf8(const std::u32string& chars)
{
    std::string out;
    out.reserve(chars.size());
    for(char32_t cp : chars)
    {
        if(cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if(cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if(cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

}
