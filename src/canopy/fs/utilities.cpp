#include <canopy/fs/utilities.h>

#include <filesystem>

namespace canopy {

void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directories(dir);
}

} // namespace canopy
