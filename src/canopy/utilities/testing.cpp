#include <canopy/utilities/testing.h>

#include <canopy/fs/utilities.h>

namespace canopy {

file_path
get_test_directory(string const& test_name)
{
    auto directory
        = std::filesystem::temp_directory_path() / "canopy_tests" / test_name;
    reset_directory(directory);
    return directory;
}

} // namespace canopy
