#ifndef CANOPY_FS_UTILITIES_H
#define CANOPY_FS_UTILITIES_H

#include <canopy/fs/types.hpp>

namespace canopy {

// Remove :dir (and everything in it) if it exists and recreate it empty.
void
reset_directory(file_path const& dir);

} // namespace canopy

#endif
