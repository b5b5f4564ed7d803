/***
 * Utility functions.
 */
#ifndef MLL_UTILS_HPP
#define MLL_UTILS_HPP

#include <cmath>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fs.hpp"
#include "typedefs.hpp"

namespace utils {

/// Assumes filepath corresponds to the path of a CSV file, and reads it as such.
/// All data stored as strings, split on whitespace. Empty lines are skipped; returns an empty vector if the file
/// does not exist.
/// Note: does NOT differentiate between header row and data rows, and does NOT do data type conversion.
std::vector<std::vector<std::string>> read_csv(const fs::path &filepath);

/// Appends `record` to `<directory>/<filename>`, creating the directory if needed.
void write_json(const nlohmann::json &record, const fs::path &directory, const std::string &filename);

/// Returns a vector filled with a constant value.
template <typename T> inline std::vector<T> constant(long size, T value) {
    std::vector<T> result(size, value);
    return result;
}

/// Returns a vector filled with values in the range[start, start+size).
template <typename T> inline std::vector<T> range(long start, long size) {
    std::vector<T> result(size, 0);
    std::iota(result.begin(), result.end(), start);
    return result;
}

/// Returns the sum of the elements in a vector.
template <typename T> inline T sum(const std::vector<T> &vector) {
    T result = 0;
    for (const T &value : vector) {
        result += value;
    }
    return result;
}

/// Returns x * log(y), with the convention that 0 * log(0) = 0.
inline double xlogy(double x, double y) {
    if (x == 0.0) return 0.0;
    return x * std::log(y);
}

}  // namespace utils

#endif // MLL_UTILS_HPP
