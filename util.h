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

#ifndef __UTIL_H__
#define __UTIL_H__

#include "config.h"

#include <stdio.h>
#ifdef HAVE_STDINT_H
#include <stdint.h>
#endif
#ifdef HAVE_INTTYPES_H
#include <inttypes.h>
#endif
#include <ctype.h>
#include <string.h>

#include <string>
#include <vector>
#include <streambuf>
#include <stdexcept>

#include <fmt/format.h>

// Munge a string to printable - printable assumed to be either a UTF8 string, or
// a pure ascii string if we can't confirm that it's UTF8
std::string munge_to_printable(const std::string& in_str) noexcept;
std::string munge_to_printable(const char *begin, size_t len) noexcept;

bool is_valid_utf8(const char *subject, size_t length);
bool is_valid_utf8(const std::string& subject);

// Replace each ill-formed UTF-8 subsequence with U+FFFD
std::string utf8_sanitize(const std::string& in_str);

// Widen ISO-8859-1 octets to UTF-8; every octet is a valid code point
std::string latin1_to_utf8(const std::string& in_str);

std::string str_lower(const std::string& in_str);
std::string str_strip(const std::string& in_str);

std::vector<std::string> str_tokenize(const std::string& in_str, const std::string& in_split);

// Convert a string to a bool: 1 for true/t, 0 for false/f, dvalue otherwise
int string_to_bool(const std::string& s, int dvalue = -1);

// Hex digit to value, -1 if not a hex digit
int x_to_i(char x);

// True if every character is a hex digit
bool is_hex_str(const std::string& in);

// Flexible method to convert a hex string to a binary string; accepts
// both upper and lower case hex, and prepends '0' to the first byte if
// an odd number of bytes in the original string.  Returns an empty string
// on a non-hex character.
std::string hex_to_bytes(const std::string& in);

// Lowercase hex rendering of a binary string
std::string bytes_to_hex(const std::string& in);

// Local copy of strerror_r because glibc did such an amazingly poor job of it
std::string hs20_strerror_r(int errnum);

// Basic override of a stream buf to allow us to operate purely from memory
struct membuf : public std::streambuf {
	membuf(const char *begin, const char *end) : begin(begin), end(end) {
		this->setg(const_cast<char *>(begin), const_cast<char *>(begin), const_cast<char *>(end));
	}

	virtual pos_type seekoff(off_type off, std::ios_base::seekdir dir,
			std::ios_base::openmode which = std::ios_base::in) override {
		if (dir == std::ios_base::cur)
			gbump(off);
		else if (dir == std::ios_base::end)
			setg(const_cast<char *>(begin), const_cast<char *>(end+off), const_cast<char *>(end));
		else if (dir == std::ios_base::beg)
			setg(const_cast<char *>(begin), const_cast<char *>(begin+off), const_cast<char *>(end));

		return gptr() - eback();
	}

	virtual pos_type seekpos(std::streampos pos, std::ios_base::openmode mode) override {
		return seekoff(pos - pos_type(off_type(0)), std::ios_base::beg, mode);
	}

	const char *begin, *end;
};

#endif

