#include <lotbook/ingest/csv_reader.hpp>
#include <lotbook/utils/logger.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace lotbook::ingest {

namespace {

bool is_blank(const std::vector<std::string>& fields) {
    for (const auto& field : fields) {
        if (field.find_first_not_of(" \t") != std::string::npos) {
            return false;
        }
    }
    return true;
}

// Number of unescaped quote characters, used to detect records spanning lines
size_t quote_count(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (c == '"') {
            ++count;
        }
    }
    return count;
}

} // namespace

core::RawTable CsvReader::read_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("CSV file does not exist: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + path);
    }

    core::RawTable table = read_stream(file);
    utils::Logger::info() << "Read " << table.rows.size() << " rows from " << path
                          << utils::Logger::endl;
    return table;
}

core::RawTable CsvReader::read_stream(std::istream& input) {
    core::RawTable table;
    bool have_header = false;

    std::string line;
    std::string record;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!record.empty()) {
            record += '\n';
        }
        record += line;
        if (quote_count(record) % 2 != 0) {
            continue;  // quoted field continues on the next line
        }

        auto fields = split_line(record);
        record.clear();

        if (!have_header) {
            if (is_blank(fields)) {
                continue;
            }
            // Strip a UTF-8 byte order mark from the first header cell
            if (!fields.empty() && fields[0].rfind("\xEF\xBB\xBF", 0) == 0) {
                fields[0] = fields[0].substr(3);
            }
            table.header = std::move(fields);
            have_header = true;
            continue;
        }

        // Blank lines keep their row number so diagnostics match the source
        table.rows.push_back(std::move(fields));
    }

    if (!record.empty()) {
        table.rows.push_back(split_line(record));
    }

    return table;
}

std::vector<std::string> CsvReader::split_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(current);
    return fields;
}

} // namespace lotbook::ingest
