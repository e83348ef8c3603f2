#include "CSVUtils.h"

#include <cstdio>
#include <sstream>

namespace {
constexpr unsigned char kUtf8Bom[3] = {0xEF, 0xBB, 0xBF};

// Tokenizer state for one logical record. Quoted fields may span physical lines.
class RecordReader {
public:
    RecordReader(std::istream& in, char delimiter, const CSVUtils::ParseLimits& limits)
        : in_(in), delimiter_(delimiter), limits_(limits) {}

    CSVUtils::RawRow read();

    bool malformed() const noexcept { return malformed_; }
    bool limitExceeded() const noexcept { return limitExceeded_; }
    size_t consumedLines() const noexcept { return consumedLines_; }

private:
    std::istream& in_;
    char delimiter_;
    const CSVUtils::ParseLimits& limits_;

    CSVUtils::RawRow row_;
    std::string field_;
    bool inQuotes_ = false;
    bool fieldQuoted_ = false;
    bool lastFieldQuoted_ = false;
    bool sawData_ = false;
    bool sawDelimiter_ = false;
    bool sawNewline_ = false;
    bool malformed_ = false;
    bool limitExceeded_ = false;
    size_t recordBytes_ = 0;
    size_t physicalLines_ = 1;
    size_t consumedLines_ = 0;

    // Each step returns false once a parse limit is hit.
    bool fail() {
        limitExceeded_ = true;
        return false;
    }

    bool consume(size_t bytes) {
        if (limits_.maxRecordBytes > 0 && recordBytes_ > limits_.maxRecordBytes - bytes) return fail();
        recordBytes_ += bytes;
        return true;
    }

    bool append(char c) {
        field_ += c;
        if (limits_.maxFieldBytes > 0 && field_.size() > limits_.maxFieldBytes) return fail();
        return true;
    }

    bool endField() {
        row_.push_back(std::move(field_));
        field_.clear();
        lastFieldQuoted_ = fieldQuoted_;
        fieldQuoted_ = false;
        if (limits_.maxColumns > 0 && row_.size() > limits_.maxColumns) return fail();
        return true;
    }

    bool quote();
    bool quotedLineBreak();
};

bool RecordReader::quote() {
    if (!inQuotes_) {
        sawData_ = true;
        if (!field_.empty()) return append('"');
        inQuotes_ = true;
        fieldQuoted_ = true;
        return true;
    }
    if (in_.peek() == '"') {
        in_.get();
        return consume(1) && append('"');
    }
    const int next = in_.peek();
    if (next == EOF || next == delimiter_ || next == '\n' || next == '\r') {
        inQuotes_ = false;
        return true;
    }
    // A stray quote inside a quoted field is kept literally.
    return append('"');
}

bool RecordReader::quotedLineBreak() {
    ++physicalLines_;
    if (limits_.maxPhysicalLinesPerRecord > 0 && physicalLines_ > limits_.maxPhysicalLinesPerRecord) {
        return fail();
    }
    return append('\n');
}

CSVUtils::RawRow RecordReader::read() {
    if (in_.peek() == EOF) return {};

    char c;
    while (in_.get(c)) {
        if (!consume(1)) break;

        if (c == '"') {
            if (!quote()) break;
        } else if (c == delimiter_ && !inQuotes_) {
            sawDelimiter_ = true;
            sawData_ = true;
            if (!endField()) break;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && in_.peek() == '\n') in_.get();
            ++consumedLines_;
            sawNewline_ = true;
            if (!inQuotes_) break;
            if (!quotedLineBreak()) break;
        } else {
            sawData_ = true;
            if (!append(c)) break;
        }
    }

    malformed_ = inQuotes_;
    if (sawData_ || sawDelimiter_ || !field_.empty()) endField();

    // A bare line break carries no record.
    if (row_.size() == 1 && row_[0].empty() && !lastFieldQuoted_ && !sawDelimiter_ && sawNewline_) {
        return {};
    }
    return std::move(row_);
}
}

namespace CSVUtils {
void skipBOM(std::istream& is) {
    if (!is.good()) return;

    size_t matched = 0;
    while (matched < sizeof(kUtf8Bom)) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kUtf8Bom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == sizeof(kUtf8Bom)) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (; matched > 0; --matched) is.unget();
}

RawRow parseCSVLine(std::istream& is,
                    char delimiter,
                    bool* malformed,
                    size_t* consumedLines,
                    bool* limitExceeded,
                    const ParseLimits& limits) {
    RecordReader reader(is, delimiter, limits);
    RawRow row = reader.read();
    if (malformed) *malformed = reader.malformed();
    if (consumedLines) *consumedLines = reader.consumedLines();
    if (limitExceeded) *limitExceeded = reader.limitExceeded();
    return row;
}

RowSplitResult splitRows(const std::string& text, char delimiter, const ParseLimits& limits) {
    RowSplitResult result;
    std::istringstream in(text);
    skipBOM(in);

    size_t line = 1;
    while (in.peek() != EOF) {
        bool malformed = false;
        bool limitExceeded = false;
        size_t consumed = 0;
        RawRow row = parseCSVLine(in, delimiter, &malformed, &consumed, &limitExceeded, limits);
        if (limitExceeded) {
            result.rows.clear();
            result.error = "Parse limit exceeded in record starting at line " + std::to_string(line);
            return result;
        }
        if (malformed) {
            result.rows.clear();
            result.error = "Unterminated quoted field in record starting at line " + std::to_string(line);
            return result;
        }
        line += consumed;
        if (row.empty()) continue;
        bool blank = true;
        for (const auto& cell : row) {
            if (!cell.empty()) {
                blank = false;
                break;
            }
        }
        // A lone empty unquoted cell is a blank line; "," still carries structure.
        if (blank && row.size() == 1) continue;
        result.rows.push_back(std::move(row));
    }
    return result;
}
} // namespace CSVUtils
