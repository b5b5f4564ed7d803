#include "utils.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils {

std::vector<std::vector<std::string>> read_csv(const fs::path &filepath) {
    std::vector<std::vector<std::string>> contents;
    if (!fs::exists(filepath)) {
        std::cerr << "ERROR " << "File doesn't exist: " << filepath << std::endl;
        return contents;
    }
    std::string line;
    std::ifstream file(filepath);
    long items = 0;
    while (std::getline(file, line)) {
        std::vector<std::string> row;
        std::stringstream line_stream(line);
        std::string value;
        while (line_stream >> value) {
            row.push_back(value);
            items++;
        }
        if (row.empty()) continue;
        contents.push_back(row);
    }
    std::cout << "Read in " << contents.size() << " lines and " << items << " values." << std::endl;
    return contents;
}

void write_json(const nlohmann::json &record, const fs::path &directory, const std::string &filename) {
    fs::create_directories(directory);
    fs::path output_filepath = directory / filename;
    std::cout << "Saving results to file: " << output_filepath << std::endl;
    std::ofstream output_file;
    output_file.open(output_filepath, std::ios_base::app);
    output_file << std::setw(4) << record << std::endl;
    output_file.close();
}

}  // namespace utils
