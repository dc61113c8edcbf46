/*
    This file is part of hs20scan

    hs20scan is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    hs20scan is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with hs20scan; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
*/

#include "config.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <string>

bool is_valid_utf8(const char *subject, size_t length) {
    size_t i, ix;
    int nb, j;

    for (i = 0, ix = length; i < ix; i++) {
        auto c = (unsigned char) subject[i];

        if (c <= 0x7f) {
            nb = 0;
        } else if ((c & 0xE0) == 0xC0) {
            nb = 1;
        } else if (c == 0xed && i < (ix - 1) &&
                ((unsigned char) subject[i+1] & 0xa0) == 0xa0) {
            return false;
        } else if ((c & 0xF0) == 0xE0) {
            nb = 2;
        } else if ((c & 0xF8) == 0xF0) {
            nb = 3;
        } else {
            return false;
        }

        for (j = 0; j < nb && i < ix; j++) {
            if ((++i == ix) || (((unsigned char) subject[i] & 0xC0) != 0x80)) {
                return false;
            }
        }
    }

    return true;
}

bool is_valid_utf8(const std::string& subject) {
	return is_valid_utf8(subject.data(), subject.size());
}

std::string latin1_to_utf8(const std::string& in_str) {
    std::string ret;
    ret.reserve(in_str.length() * 2);

    for (auto ch : in_str) {
        auto c = (unsigned char) ch;

        if (c < 0x80) {
            ret += (char) c;
        } else {
            ret += (char) (0xC0 | (c >> 6));
            ret += (char) (0x80 | (c & 0x3F));
        }
    }

    return ret;
}

std::string utf8_sanitize(const std::string& in_str) {
    std::string ret;
    ret.reserve(in_str.length());

    size_t i = 0;
    const size_t len = in_str.length();

    while (i < len) {
        auto c = (unsigned char) in_str[i];

        if (c < 0x80) {
            ret += (char) c;
            i++;
            continue;
        }

        // Sequence length and the allowed range of the second byte; the
        // narrowed ranges exclude overlong forms, surrogates and > U+10FFFF
        unsigned int nb = 0;
        unsigned char lo = 0x80, hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            nb = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            nb = 2;
            if (c == 0xE0)
                lo = 0xA0;
            else if (c == 0xED)
                hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            nb = 3;
            if (c == 0xF0)
                lo = 0x90;
            else if (c == 0xF4)
                hi = 0x8F;
        }

        // Count the valid bytes of the sequence; a bad byte ends the
        // ill-formed subsequence without being consumed
        size_t valid = 1;

        if (nb > 0) {
            while (valid <= nb && i + valid < len) {
                auto n = (unsigned char) in_str[i + valid];

                if (valid == 1 ? (n < lo || n > hi) : ((n & 0xC0) != 0x80))
                    break;

                valid++;
            }
        }

        if (nb > 0 && valid == nb + 1) {
            ret.append(in_str, i, valid);
        } else {
            // U+FFFD
            ret += "\xEF\xBF\xBD";
        }

        i += valid;
    }

    return ret;
}

/* Escaping rules follow the json string sanitizer; non-utf8 content is rendered as
 * ascii with \xNN escapes */
std::string munge_to_printable(const char *s, size_t len) noexcept {
	if (len == 0)
		return "";

    const auto utf8 = is_valid_utf8(s, len);

    std::string result;
    result.reserve(len);

    for (size_t i = 0; i < len; i++) {
        auto c = (unsigned char) s[i];

        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (!utf8) {
                    if (c >= 32 && c <= 126)
                        result += (char) c;
                    else
                        result += fmt::format("\\x{:02X}", c);
                } else {
                    if (c <= 0x1f)
                        result += fmt::format("\\u{:04x}", c);
                    else
                        result += (char) c;
                }

                break;
        }
    }

    return result;
}

std::string munge_to_printable(const std::string& s) noexcept {
	return munge_to_printable(s.data(), s.length());
}

std::string str_lower(const std::string& in_str) {
    std::string retstr(in_str);
    std::transform(retstr.begin(), retstr.end(), retstr.begin(), (int(*)(int)) std::tolower);
    return retstr;
}

std::string str_strip(const std::string& in_str) {
    auto start = in_str.find_first_not_of(" \t\r\n");

    if (start == std::string::npos)
        return "";

    auto end = in_str.find_last_not_of(" \t\r\n");

    return in_str.substr(start, end - start + 1);
}

std::vector<std::string> str_tokenize(const std::string& in_str, const std::string& in_split) {
    std::vector<std::string> ret;

    size_t begin = 0;
    size_t end;

    while ((end = in_str.find_first_of(in_split, begin)) != std::string::npos) {
        if (end > begin)
            ret.push_back(in_str.substr(begin, end - begin));
        begin = end + 1;
    }

    if (begin < in_str.length())
        ret.push_back(in_str.substr(begin));

    return ret;
}

int string_to_bool(const std::string& s, int dvalue) {
    std::string ls = str_lower(s);

	if (ls == "true" || ls == "t") {
		return 1;
	} else if (ls == "false" || ls == "f") {
		return 0;
	}

	return dvalue;
}

int x_to_i(char x) {
    if (isxdigit((unsigned char) x)) {
        if (x <= '9')
            return x - '0';
        return toupper(x) - 'A' + 10;
    }

    return -1;
}

bool is_hex_str(const std::string& in) {
    return std::all_of(in.begin(), in.end(), [](char c) { return x_to_i(c) >= 0; });
}

std::string hex_to_bytes(const std::string& in) {
    if (in.length() == 0)
        return "";

    std::string ret;
    ret.reserve((in.length() / 2) + 1);
    size_t p = 0;

    // Prefix with a 0 if we're an odd length
    if ((in.length() % 2) != 0) {
        auto b = x_to_i(in[0]);

        if (b < 0)
            return "";

        ret += (char) b;
        p = 1;
    }

    for (size_t x = p; x + 1 < in.length(); x += 2) {
        auto b1 = x_to_i(in[x]);
        auto b2 = x_to_i(in[x + 1]);

        if (b1 < 0 || b2 < 0)
            return "";

        ret += (char) (((b1 & 0xF) << 4) + (b2 & 0xF));
    }

    return ret;
}

std::string bytes_to_hex(const std::string& in) {
    std::string rs;

    rs.reserve(in.length() * 2);

    for (auto c : in)
        rs += fmt::format("{:02x}", (uint8_t) c);

    return rs;
}

static const char *strerror_result(int, const char *s) {
    return s;
}

static const char *strerror_result(const char *s, const char *) {
    return s;
}

std::string hs20_strerror_r(int errnum) {
    char d_errstr[1024];

    auto r = std::string(strerror_result(strerror_r(errnum, d_errstr, sizeof(d_errstr)), d_errstr));

    if (r.length() == 0)
        return fmt::format("Unknown error: {}", errnum);

    return r;
}

