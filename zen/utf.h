// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>


namespace zen
{
//convert between UTF-8 char-based and UTF-32 wchar_t-based strings (conversion only if necessary)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

//check for UTF-8 encoding errors
bool isValidUtf8(std::string_view str);

//number of trailing bytes that start a UTF-8 sequence which is cut off at the end of the buffer
size_t getTruncatedUtf8Tail(std::string_view str);








//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;
using Char8     = unsigned char;

static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");

constexpr CodePoint LEAD_SURROGATE      = 0xd800;
constexpr CodePoint TRAIL_SURROGATE_MAX = 0xdfff;
constexpr CodePoint REPLACEMENT_CHAR    = 0xfffd;
constexpr CodePoint CODE_POINT_MAX      = 0x10ffff;


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a Char8
{
    if (cp <= 0b111'1111)
        writeOutput(static_cast<Char8>(cp));
    else if (cp <= 0b0111'1111'1111)
    {
        writeOutput(static_cast<Char8>((cp >> 6)        | 0b1100'0000)); //110x xxxx
        writeOutput(static_cast<Char8>((cp & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else if (cp <= 0b1111'1111'1111'1111)
    {
        if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX) //[0xd800, 0xdfff]
            codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
        else
        {
            writeOutput(static_cast<Char8>( (cp >> 12)             | 0b1110'0000)); //1110 xxxx
            writeOutput(static_cast<Char8>(((cp >> 6) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
            writeOutput(static_cast<Char8>( (cp       & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        }
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<Char8>( (cp >> 18)              | 0b1111'0000)); //1111 0xxx
        writeOutput(static_cast<Char8>(((cp >> 12) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<Char8>(((cp >> 6)  & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<Char8>( (cp        & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput); //resolves to 3-byte UTF8
}


class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) : it_(reinterpret_cast<const Char8*>(str.data())), last_(it_ + str.size()) {}

    //returns std::nullopt at end of string; invalid sequences decode to REPLACEMENT_CHAR and set "hadError()"
    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return std::nullopt;

        const Char8 ch = *it_++;
        CodePoint cp = ch;

        if (ch < 0x80) //1 byte
            ;
        else if (ch >> 5 == 0b110) //2 bytes
        {
            cp &= 0b1'1111;
            if (decodeTrail(cp))
                if (cp <= 0b111'1111) //overlong encoding
                    setError(cp);
        }
        else if (ch >> 4 == 0b1110) //3 bytes
        {
            cp &= 0b1111;
            if (decodeTrail(cp) && decodeTrail(cp))
                if (cp <= 0b0111'1111'1111 ||
                    (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX)) //[0xd800, 0xdfff] are invalid code points
                    setError(cp);
        }
        else if (ch >> 3 == 0b11110) //4 bytes
        {
            cp &= 0b111;
            if (decodeTrail(cp) && decodeTrail(cp) && decodeTrail(cp))
                if (cp <= 0b1111'1111'1111'1111 || cp > CODE_POINT_MAX)
                    setError(cp);
        }
        else //invalid begin of UTF8 encoding
            setError(cp);

        return cp;
    }

    bool hadError() const { return error_; }

private:
    bool decodeTrail(CodePoint& cp)
    {
        if (it_ != last_) //trail byte expected!
        {
            const Char8 ch = *it_;
            if (ch >> 6 == 0b10)
            {
                cp = (cp << 6) + (ch & 0b11'1111);
                ++it_;
                return true;
            }
        }
        setError(cp);
        return false;
    }

    void setError(CodePoint& cp)
    {
        cp = REPLACEMENT_CHAR;
        error_ = true;
    }

    const Char8* it_;
    const Char8* const last_;
    bool error_ = false;
};


template <class Char> inline
std::basic_string_view<Char> makeUtfView(const std::basic_string<Char>& str) { return str; }

template <class Char> inline
std::basic_string_view<Char> makeUtfView(std::basic_string_view<Char> str) { return str; }

inline std::string_view  makeUtfView(const char*    str) { return str; }
inline std::wstring_view makeUtfView(const wchar_t* str) { return str; }
}


inline
bool isValidUtf8(std::string_view str)
{
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ;
    return !decoder.hadError();
}


inline
size_t getTruncatedUtf8Tail(std::string_view str)
{
    //a UTF-8 sequence is at most 4 bytes => look at the last 3 bytes for a lead byte
    for (size_t i = 1; i <= 3 && i <= str.size(); ++i)
    {
        const auto ch = static_cast<impl::Char8>(str[str.size() - i]);

        if (ch >> 6 == 0b10) //trail byte: keep searching for the lead
            continue;

        size_t seqLen = 0;
        if      (ch >> 5 == 0b110)   seqLen = 2;
        else if (ch >> 4 == 0b1110)  seqLen = 3;
        else if (ch >> 3 == 0b11110) seqLen = 4;

        return seqLen > i ? i : 0;
    }
    return 0;
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto strView = impl::makeUtfView(str);
    using SourceChar = typename decltype(strView)::value_type;
    using TargetChar = typename TargetString::value_type;

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(strView);
    else if constexpr (std::is_same_v<SourceChar, char>) //UTF-8 -> UTF-32
    {
        TargetString output;
        impl::Utf8Decoder decoder(strView);
        while (const std::optional<impl::CodePoint> cp = decoder.getNext())
            output += static_cast<TargetChar>(*cp);
        return output;
    }
    else //UTF-32 -> UTF-8
    {
        TargetString output;
        for (const wchar_t ch : strView)
            impl::codePointToUtf8(static_cast<impl::CodePoint>(ch), [&](impl::Char8 c) { output += static_cast<TargetChar>(c); });
        return output;
    }
}
}

#endif //UTF_H_01832479146991573473545
