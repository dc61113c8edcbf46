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

#ifndef __HS20_ERROR_H__
#define __HS20_ERROR_H__

#include <stdexcept>
#include <string>

// Top-level exception; nothing is constructed when one of these escapes a parser
struct hs20_exception : public std::runtime_error {
    hs20_exception(std::string const& message) :
        std::runtime_error(message) {}
};

// Input text can't be interpreted (missing separator, non-hex content)
struct hs20_invalid_input : public hs20_exception {
    hs20_invalid_input(std::string const& message) :
        hs20_exception(message) {}
};

// MAC address text without exactly 12 hex digits
struct hs20_invalid_address : public hs20_invalid_input {
    hs20_invalid_address(std::string const& message) :
        hs20_invalid_input(message) {}
};

// IE stream is structurally broken; lengths overrun the buffer or an element
// doesn't have the shape its tag requires
struct hs20_malformed_element : public hs20_exception {
    hs20_malformed_element(std::string const& message) :
        hs20_exception(message) {}
};

#endif

