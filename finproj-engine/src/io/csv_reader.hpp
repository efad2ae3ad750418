#ifndef FINPROJ_CSV_READER_HPP
#define FINPROJ_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace finproj {

// Line-oriented CSV reader. Handles double-quoted cells (statement labels
// exported by spreadsheets sometimes contain commas) and CRLF line endings.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    static std::string trim(const std::string& s);

private:
    std::istream& is_;
    char delimiter_;
};

} // namespace finproj

#endif // FINPROJ_CSV_READER_HPP
