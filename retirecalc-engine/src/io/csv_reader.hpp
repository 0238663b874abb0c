#ifndef RETIRECALC_CSV_READER_HPP
#define RETIRECALC_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace retirecalc {

// Line-oriented CSV reader for the engine's lookup tables.
// Cells are trimmed; double-quoted cells may contain the delimiter;
// lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more();

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace retirecalc

#endif // RETIRECALC_CSV_READER_HPP
