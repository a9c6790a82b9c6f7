#ifndef CANOPY_UTILITIES_ERRORS_H
#define CANOPY_UTILITIES_ERRORS_H

#include <canopy/core/exception.hpp>

namespace canopy {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
CANOPY_DEFINE_ERROR_INFO(string, internal_error_message)

// the identifier of the node that an operation was acting on
CANOPY_DEFINE_ERROR_INFO(string, target)

// A source failed to enumerate the children of a node.
// Sources throw this (with target_info and usually internal_error_message_info)
// and caches pass it through untouched to every caller waiting on the fetch.
CANOPY_DEFINE_EXCEPTION(source_fetch_error)

// A node passed to an invalidation call couldn't be resolved to a target.
CANOPY_DEFINE_EXCEPTION(invalid_target_error)

// A configuration value is missing, malformed or out of its valid range.
CANOPY_DEFINE_EXCEPTION(configuration_error)
CANOPY_DEFINE_ERROR_INFO(string, config_option)
CANOPY_DEFINE_ERROR_INFO(string, config_value)

// A requested depth is neither the complete sentinel nor within
// [0, max_depth].
CANOPY_DEFINE_EXCEPTION(invalid_depth_error)
CANOPY_DEFINE_ERROR_INFO(integer, requested_depth)
CANOPY_DEFINE_ERROR_INFO(integer, max_depth)

} // namespace canopy

#endif
