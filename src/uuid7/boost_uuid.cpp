/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/boost_uuid.hpp"

#include <algorithm>


namespace uuid7
{


boost::uuids::uuid to_boost(const uuid& u) noexcept
{
    const auto bytes = to_bytes(u);
    boost::uuids::uuid result;
    std::copy(bytes.begin(), bytes.end(), result.begin());
    return result;
}


uuid from_boost(const boost::uuids::uuid& u)
{
    return from_bytes(gsl::span<const std::uint8_t>(u.data));
}


} // namespace uuid7
