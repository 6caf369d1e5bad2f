#include "Csv.hpp"
#include "common.hpp"

CsvReader::CsvReader(std::istream& in) : in_(in) {}

bool CsvReader::readRow(std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool quoted = false;
    bool any = false;

    for (;;) {
        int ch = in_.get();
        if (ch == std::char_traits<char>::eof()) {
            if (quoted) throw InputError("unterminated quoted field at line " + std::to_string(line_ + 1));
            if (!any) return false;
            fields.push_back(field);
            ++line_;
            return true;
        }
        any = true;
        char c = static_cast<char>(ch);

        if (quoted) {
            if (c == '"') {
                if (in_.peek() == '"') {
                    in_.get();
                    field += '"';
                }
                else {
                    quoted = false;
                }
            }
            else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            quoted = true;
        }
        else if (c == ',') {
            fields.push_back(field);
            field.clear();
        }
        else if (c == '\r') {
            if (in_.peek() == '\n') in_.get();
            break;
        }
        else if (c == '\n') {
            break;
        }
        else {
            field += c;
        }
    }

    fields.push_back(field);
    ++line_;
    return true;
}

static std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\xEF\xBB\xBF");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

CsvHeader::CsvHeader(std::vector<std::string> names) : names_(std::move(names)) {
    for (auto& n : names_) n = trimmed(n);
}

std::optional<std::size_t> CsvHeader::find(std::initializer_list<const char*> candidates) const {
    for (const char* want : candidates) {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (names_[i] == want) return i;
        }
    }
    return std::nullopt;
}

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string csvLine(const std::vector<std::string>& fields) {
    std::vector<std::string> escaped;
    escaped.reserve(fields.size());
    for (const auto& f : fields) escaped.push_back(csvEscape(f));
    return joinStrings(escaped, ",");
}
