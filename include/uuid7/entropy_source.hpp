/**
 *  \file
 *  Sources of random bits for UUID generation.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_ENTROPY_SOURCE_HPP
#define UUID7_ENTROPY_SOURCE_HPP

#include <gsl/span>

#include <cstdint>
#include <memory>


namespace uuid7
{


/**
 *  An interface for classes that produce random bytes.
 *
 *  A generator calls its entropy source only while holding its own lock, so
 *  implementations need not be thread safe unless the same object is shared
 *  between several generators.
 */
class entropy_source
{
public:
    /**
     *  Fills `buffer` with uniformly distributed random bytes.
     *
     *  Implementations must report failure by throwing; they must never
     *  leave `buffer` partly filled and return normally.
     */
    virtual void fill(gsl::span<std::uint8_t> buffer) = 0;

    virtual ~entropy_source() noexcept = default;
};


/**
 *  An entropy source backed by the operating system's cryptographically
 *  secure random number generator.
 *
 *  Failures of the underlying device are reported as `uuid7::error` with
 *  code `errc::entropy_unavailable`.
 */
class system_entropy_source : public entropy_source
{
public:
    system_entropy_source();
    ~system_entropy_source() noexcept;

    system_entropy_source(const system_entropy_source&) = delete;
    system_entropy_source& operator=(const system_entropy_source&) = delete;

    void fill(gsl::span<std::uint8_t> buffer) override;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};


} // namespace uuid7
#endif // header guard
