#pragma once
#include <string>
#include <vector>

namespace lotbook::core {

// Untyped rows as delivered by an external source. Row i of rows is data row i + 1.
struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
};

} // namespace lotbook::core
