/**
 *  \file
 *  Information about this library.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_LIB_INFO_HPP
#define UUID7_LIB_INFO_HPP


namespace uuid7
{


/**
 *  Short form of the library name, guaranteed to contain only alphanumeric
 *  characters, dashes and underscores (no spaces).
 */
constexpr const char* library_short_name = "libuuid7";


/// Software version
struct version
{
    int major = 0;
    int minor = 0;
    int patch = 0;
};


/// Returns the version of the libuuid7 library.
version library_version();


} // namespace uuid7
#endif // header guard
