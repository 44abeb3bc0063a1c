/**
 *  \file
 *  Exceptions and error codes.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_EXCEPTION_HPP
#define UUID7_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <system_error>


namespace uuid7
{


/// Error conditions specific to this library.
enum class errc
{
    success = 0,

    /**
     *  A binary or textual UUID representation does not have the required
     *  canonical form.
     *
     *  This error condition has its own exception class:
     *  `uuid7::format_error`
     */
    format_error,

    /// The source of random bits failed to deliver.
    entropy_unavailable
};


/// A category for errors specific to this library.
const std::error_category& error_category() noexcept;


/// Constructs a library-specific error condition.
std::error_condition make_error_condition(errc e) noexcept;


/// Constructs an error code for a library-specific error condition.
std::error_code make_error_code(errc e) noexcept;


/**
 *  The base class for exceptions specific to this library.
 *
 *  The `code()` function returns an `std::error_code` that specifies more
 *  precisely which error occurred.  Usually, this code will correspond to one
 *  of the error conditions defined in `uuid7::errc`.
 */
class error : public std::runtime_error
{
public:
    /// Constructs an exception with the given error code.
    explicit error(std::error_code ec)
        : std::runtime_error(ec.message())
        , code_(ec)
    {}

    /**
     *  Constructs an exception with the given error code and an additional
     *  error message.
     *
     *  The `what()` function is guaranteed to return a string which contains
     *  the text in `msg` in addition to the standard message associated with
     *  `ec`.
     */
    error(std::error_code ec, const std::string& msg)
        : std::runtime_error(ec.message() + ": " + msg)
        , code_(ec)
    {}

    /// Returns an error code.
    const std::error_code& code() const noexcept { return code_; }

private:
    std::error_code code_;
};


/**
 *  An exception which indicates that a UUID could not be decoded from its
 *  binary or textual representation.
 *
 *  This is merely a `uuid7::error` with code `errc::format_error`.
 */
class format_error : public error
{
public:
    /// Constructs an exception with a default error message.
    format_error()
        : error(make_error_code(errc::format_error))
    {}

    /// Constructs an exception with a custom error message.
    explicit format_error(const std::string& msg)
        : error(make_error_code(errc::format_error), msg)
    {}
};


} // namespace uuid7


namespace std
{
// Enable implicit conversions from errc to std::error_condition.
template<>
struct is_error_condition_enum<uuid7::errc> : public true_type
{
};
} // namespace std
#endif // header guard
