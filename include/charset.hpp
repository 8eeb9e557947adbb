/**
 * @file charset.hpp
 * @brief Code page 437 character classes for FATX file names
 * @copyright Released under the GNU GPL 3 License.
 *
 * FATX names are stored as single bytes in code page 437.  The byte classes
 * below follow the FATX reverse-engineering notes at
 * https://free60.org/System-Software/Systems/FATX/ and
 * https://en.wikipedia.org/wiki/Code_page_437#Character_set
 */

#ifndef CHARSET_H_
#define CHARSET_H_

#include <cstdint>
#include <span>
#include <string>

namespace fatxrec {

//! Tests if a byte may appear in a FATX file name.
bool is_valid_name_byte(uint8_t c);

//! Tests if a byte is reserved in FATX (or FAT short) names.
//! Not consulted by the orphan validator; kept for a stricter check.
bool is_reserved_name_byte(uint8_t c);

//! Tests if every byte of a name is a valid name byte.
bool is_valid_name(std::span<const uint8_t> name);

//! Decodes code page 437 bytes into UTF-8.
std::string cp437_to_utf8(std::span<const uint8_t> bytes);

//! Decodes ISO-8859-1 bytes into UTF-8.
std::string latin1_to_utf8(std::span<const uint8_t> bytes);

//! Appends the UTF-8 encoding of a code point.
void append_utf8(std::string &out, char32_t cp);

} // namespace fatxrec

#endif // CHARSET_H_
