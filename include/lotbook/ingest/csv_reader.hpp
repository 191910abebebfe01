#pragma once

#include <lotbook/core/raw_table.hpp>
#include <istream>
#include <string>
#include <vector>

namespace lotbook::ingest {

class CsvReader {
public:
    // Throws std::runtime_error when the file is missing or unreadable
    static core::RawTable read_file(const std::string& path);
    static core::RawTable read_stream(std::istream& input);

    // Splits one record, honoring double quotes and "" escapes
    static std::vector<std::string> split_line(const std::string& line);
};

} // namespace lotbook::ingest
