/**
 *  \file
 *  Error handling facilities.
 *
 *  \copyright
 *      This Source Code Form is subject to the terms of the Mozilla Public
 *      License, v. 2.0. If a copy of the MPL was not distributed with this
 *      file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#ifndef UUID7_ERROR_HPP
#define UUID7_ERROR_HPP


/**
 *  \def    UUID7_PRECONDITION(test)
 *  Checks that a precondition holds, and if not, prints an error message to
 *  the standard error stream and terminates the program.
 *
 *  Use this for conditions that only a bug in the calling code can violate.
 */
#define UUID7_PRECONDITION(test)                                           \
    do {                                                                   \
        if (!(test)) {                                                     \
            ::uuid7::detail::precondition_violated(__FUNCTION__, #test);   \
        }                                                                  \
    } while (false)

/**
 *  \def    UUID7_PANIC()
 *  Prints an error message to the standard error stream and terminates
 *  the program.
 *
 *  The printed message will contain the file name and line number at which
 *  the macro is invoked.  The program is terminated by calling
 *  `std::terminate()`.
 */
#define UUID7_PANIC()                                        \
    do {                                                     \
        ::uuid7::detail::panic(__FILE__, __LINE__, nullptr); \
    } while (false)

/**
 *  \def    UUID7_PANIC_M(message)
 *  Prints a custom error message to the standard error stream and
 *  terminates the program.
 *
 *  The printed message will contain the file name and line number at which
 *  the macro is invoked, in addition to the text provided in `message`.
 *  The program is terminated by calling `std::terminate()`.
 */
#define UUID7_PANIC_M(message)                               \
    do {                                                     \
        ::uuid7::detail::panic(__FILE__, __LINE__, message); \
    } while (false)


namespace uuid7
{
namespace detail
{
[[noreturn]] void precondition_violated(
    const char* function,
    const char* condition) noexcept;

[[noreturn]] void panic(const char* file, int line, const char* msg) noexcept;
} // namespace detail
} // namespace uuid7
#endif // header guard
