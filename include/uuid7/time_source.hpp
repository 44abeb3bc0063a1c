/**
 *  \file
 *  Wall-clock time sources for UUID generation.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_TIME_SOURCE_HPP
#define UUID7_TIME_SOURCE_HPP

#include <cstdint>


namespace uuid7
{


/**
 *  An interface for classes that report the current wall-clock time.
 *
 *  The generator reads its time source once per generated UUID, from within
 *  its critical section.  An implementation is free to return the same value
 *  repeatedly or to go backwards; the generator absorbs both.
 */
class time_source
{
public:
    /// Returns the number of milliseconds since the Unix epoch.
    virtual std::uint64_t now_ms() = 0;

    virtual ~time_source() noexcept = default;
};


/// A time source that reads `std::chrono::system_clock`.
class system_time_source : public time_source
{
public:
    std::uint64_t now_ms() override;
};


} // namespace uuid7
#endif // header guard
