/*
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */
#include "uuid7/log/logger.hpp"

#include "uuid7/error.hpp"

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace uuid7
{
namespace log
{

namespace
{

spdlog::level::level_enum convert(level lvl)
{
    switch (lvl) {
        case level::trace: return spdlog::level::trace;
        case level::debug: return spdlog::level::debug;
        case level::info: return spdlog::level::info;
        case level::warn: return spdlog::level::warn;
        case level::err: return spdlog::level::err;
        case level::off: return spdlog::level::off;
        default: UUID7_PANIC_M("Invalid log level");
    }
}

struct logger
{

    void set_level(level lvl)
    {
        logger_->set_level(convert(lvl));
    }

    void log(level lvl, std::string_view msg)
    {
        logger_->log(convert(lvl), msg);
    }

    static logger& get_instance()
    {
        static logger l;
        return l;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;

    logger()
        : logger_(spdlog::stdout_color_mt("uuid7"))
    { }
};

} // namespace

void set_logging_level(level lvl)
{
    logger::get_instance().set_level(lvl);
}

void log(level lvl, std::string_view msg)
{
    logger::get_instance().log(lvl, msg);
}

} // namespace log
} // namespace uuid7
