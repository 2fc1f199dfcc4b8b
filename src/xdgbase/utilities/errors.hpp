#ifndef XDGBASE_UTILITIES_ERRORS_HPP
#define XDGBASE_UTILITIES_ERRORS_HPP

#include <xdgbase/core/exception.hpp>

namespace xdgbase {

// If an error occurs internally within a library that provides its own
// error messages, this is used to convey that message.
XDGBASE_DEFINE_ERROR_INFO(string, internal_error_message)

// This exception is used when a low-level system call fails (one that should
// generally always work) and there is really no point in creating a specific
// exception type for it.
XDGBASE_DEFINE_EXCEPTION(system_call_failed)
XDGBASE_DEFINE_ERROR_INFO(string, failed_system_call)

} // namespace xdgbase

#endif
