#ifndef FS_DOT_HPP
#define FS_DOT_HPP

// Short name for the filesystem library, used throughout.

#include <filesystem>

namespace fs = std::filesystem;
using std::error_code;

#endif // FS_DOT_HPP
