/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/entropy_source.hpp"

#include "uuid7/exception.hpp"
#include "uuid7/log/logger.hpp"

#include <boost/random/random_device.hpp>

#include <exception>


namespace uuid7
{


class system_entropy_source::impl
{
public:
    void fill(gsl::span<std::uint8_t> buffer)
    {
        try {
            std::size_t i = 0;
            while (i < buffer.size()) {
                auto word = device_();
                for (int b = 0; b < 4 && i < buffer.size(); ++b, ++i) {
                    buffer[i] = static_cast<std::uint8_t>(word);
                    word >>= 8;
                }
            }
        } catch (const std::exception& e) {
            log::err("Failed to read from the system random device: {}", e.what());
            throw error(make_error_code(errc::entropy_unavailable), e.what());
        }
    }

private:
    boost::random::random_device device_;
};


system_entropy_source::system_entropy_source()
{
    try {
        pimpl_ = std::make_unique<impl>();
    } catch (const std::exception& e) {
        log::err("Failed to open the system random device: {}", e.what());
        throw error(make_error_code(errc::entropy_unavailable), e.what());
    }
}

system_entropy_source::~system_entropy_source() noexcept = default;

void system_entropy_source::fill(gsl::span<std::uint8_t> buffer)
{
    pimpl_->fill(buffer);
}


} // namespace uuid7
