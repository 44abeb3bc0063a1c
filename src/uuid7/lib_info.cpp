/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/lib_info.hpp"


namespace uuid7
{


version library_version()
{
    return {UUID7_VERSION_MAJOR, UUID7_VERSION_MINOR, UUID7_VERSION_PATCH};
}


} // namespace uuid7
