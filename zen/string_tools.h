// *****************************************************************************
// * This file is part of the Cymo project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Cymo Authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//enhance *any* string class with useful non-member functions:
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!

template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//convert integral numbers
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //returns 0 on parse error








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //do not use std::isspace(): locale-dependent and undefined behavior for negative char values!
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isLineBreak(Char c)
{
    return c == static_cast<Char>('\r') || c == static_cast<Char>('\n');
}


template <class Char> inline
bool isDigit(Char c) //similar to implementation of std::isdigit()!
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


namespace impl
{
//view on a string-like object or a single character
template <class Char, class T> inline
std::basic_string_view<Char> makeView(const T& str)
{
    if constexpr (std::is_same_v<T, Char>)
        return {&str, 1};
    else
        return str; //std::basic_string, std::basic_string_view, const Char*, Char[N]
}


template <class S, class T> inline
std::basic_string_view<typename S::value_type> makeViewFor(const T& str) { return makeView<typename S::value_type>(str); }
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::makeViewFor<S>(str).find(impl::makeViewFor<S>(term)) != std::basic_string_view<typename S::value_type>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto strView = impl::makeViewFor<S>(str);
    const auto preView = impl::makeViewFor<S>(prefix);
    return strView.size() >= preView.size() && strView.compare(0, preView.size(), preView) == 0;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto strView  = impl::makeViewFor<S>(str);
    const auto postView = impl::makeViewFor<S>(postfix);
    return strView.size() >= postView.size() && strView.compare(strView.size() - postView.size(), postView.size(), postView) == 0;
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::makeViewFor<S>(str);
    const auto termView = impl::makeViewFor<S>(term);

    const size_t pos = strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView = impl::makeViewFor<S>(str);

    const size_t pos = strView.rfind(impl::makeViewFor<S>(term));
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::makeViewFor<S>(str);
    const auto termView = impl::makeViewFor<S>(term);

    const size_t pos = strView.find(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView = impl::makeViewFor<S>(str);

    const size_t pos = strView.find(impl::makeViewFor<S>(term));
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    const auto strView = impl::makeViewFor<S>(str);
    std::vector<S> output;

    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = strView.find(delimiter, blockStart);
        const auto block = strView.substr(blockStart, blockEnd == strView.npos ? strView.npos : blockEnd - blockStart);

        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);

        if (blockEnd == strView.npos)
            return output;
        blockStart = blockEnd + 1;
    }
}


template <class S> inline
S trimCpy(const S& str)
{
    const auto strView = impl::makeViewFor<S>(str);

    size_t first = 0;
    size_t last  = strView.size();

    while (first < last && isWhiteSpace(strView[first]))
        ++first;
    while (last > first && isWhiteSpace(strView[last - 1]))
        --last;

    return S(strView.substr(first, last - first));
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::makeViewFor<S>(oldTerm);
    const auto newView = impl::makeViewFor<S>(newTerm);
    if (oldView.empty())
        return;

    S output;
    const auto strView = impl::makeViewFor<S>(str);

    for (size_t pos = 0;;)
    {
        const size_t posFound = strView.find(oldView, pos);
        if (posFound == strView.npos)
        {
            if (pos == 0) //optimize "oldTerm not found": return unchanged
                return;
            output += strView.substr(pos);
            break;
        }
        output += strView.substr(pos, posFound - pos);
        output += newView;
        pos = posFound + oldView.size();
    }
    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);

    char buffer[64] = {};
    const std::to_chars_result rv = std::to_chars(buffer, buffer + sizeof(buffer), number);
    return S(buffer, rv.ptr); //char -> wchar_t: digits are ASCII
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);

    const S trimmed = trimCpy(str);

    std::string ascii;
    for (const auto c : impl::makeViewFor<S>(trimmed))
    {
        if (!(isDigit(c) || c == static_cast<decltype(c)>('-') || c == static_cast<decltype(c)>('+')))
            return 0;
        ascii += static_cast<char>(c);
    }
    if (!ascii.empty() && ascii[0] == '+')
        ascii.erase(0, 1);

    Num number = 0;
    const std::from_chars_result rv = std::from_chars(ascii.data(), ascii.data() + ascii.size(), number);
    if (rv.ec != std::errc() || rv.ptr != ascii.data() + ascii.size())
        return 0;
    return number;
}
}

#endif //STRING_TOOLS_H_213458973046
