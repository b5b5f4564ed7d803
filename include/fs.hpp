#ifndef MLL_FS_HPP
#define MLL_FS_HPP

#include <filesystem>

namespace fs = std::filesystem;

#endif // MLL_FS_HPP
