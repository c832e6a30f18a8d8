/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>

namespace nyx {

Status::Status() :
    value_(NYX_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tNYX_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::stringstream ss;
        ss << *this;
        NYX_DebugLog("%s", ss.str().c_str());
    }
    return *this;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace nyx
