/**
 *  \file
 *  Conversions between `uuid7::uuid` and `boost::uuids::uuid`.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_BOOST_UUID_HPP
#define UUID7_BOOST_UUID_HPP

#include <uuid7/uuid.hpp>

#include <boost/uuid/uuid.hpp>


namespace uuid7
{


/**
 *  Converts a UUID to its Boost.Uuid counterpart.
 *
 *  Boost stores UUIDs as 16 bytes in network order, so
 *  `boost::uuids::to_string(to_boost(u)) == to_string(u)`.
 */
boost::uuids::uuid to_boost(const uuid& u) noexcept;


/// Converts a Boost.Uuid value to a `uuid`.
uuid from_boost(const boost::uuids::uuid& u);


} // namespace uuid7
#endif // header guard
