#ifndef CANOPY_UTILITIES_TESTING_H
#define CANOPY_UTILITIES_TESTING_H

#include <boost/optional/optional_io.hpp>
#include <catch2/catch.hpp>

#include <canopy/fs/types.hpp>

namespace canopy {

// Get a fresh, empty directory (under the system's temporary directory) for
// a test to work in. The directory is named after :test_name.
file_path
get_test_directory(string const& test_name);

} // namespace canopy

#endif
