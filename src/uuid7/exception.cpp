/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/exception.hpp"

#include "uuid7/error.hpp"
#include "uuid7/lib_info.hpp"


namespace uuid7
{


namespace
{
class my_error_category : public std::error_category
{
public:
    const char* name() const noexcept final override
    {
        return library_short_name;
    }

    std::string message(int ev) const final override
    {
        switch (static_cast<errc>(ev)) {
            case errc::success:
                return "Success";
            case errc::format_error:
                return "Invalid UUID representation";
            case errc::entropy_unavailable:
                return "Entropy source unavailable";
            default:
                UUID7_PANIC();
        }
    }
};
} // namespace


const std::error_category& error_category() noexcept
{
    static my_error_category instance;
    return instance;
}


std::error_condition make_error_condition(errc e) noexcept
{
    return std::error_condition(static_cast<int>(e), error_category());
}


std::error_code make_error_code(errc e) noexcept
{
    return std::error_code(static_cast<int>(e), error_category());
}


} // namespace uuid7
