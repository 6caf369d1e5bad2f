#pragma once
#include <cstddef>
#include <initializer_list>
#include <istream>
#include <optional>
#include <string>
#include <vector>

// RFC 4180 reader: quoted fields, doubled quotes, embedded newlines,
// CRLF or LF line ends.
class CsvReader {
public:
    explicit CsvReader(std::istream& in);

    // false at end of input
    bool readRow(std::vector<std::string>& fields);

    std::size_t line() const { return line_; }

private:
    std::istream& in_;
    std::size_t line_{0};
};

// Column lookup by any of several header spellings.
class CsvHeader {
public:
    explicit CsvHeader(std::vector<std::string> names);

    std::optional<std::size_t> find(std::initializer_list<const char*> candidates) const;
    const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
};

std::string csvEscape(const std::string& field);
std::string csvLine(const std::vector<std::string>& fields);
