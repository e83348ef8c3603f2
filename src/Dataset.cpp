#include "Dataset.h"
#include "CommonUtils.h"
#include "CurateExceptions.h"
#include <fstream>

namespace CellValues {
bool isMissing(const CellValue& v) {
    const auto* s = std::get_if<std::string>(&v);
    return s != nullptr && s->empty();
}

bool isNumeric(const CellValue& v) {
    return std::holds_alternative<double>(v);
}

std::string toString(const CellValue& v) {
    if (const auto* d = std::get_if<double>(&v)) return CommonUtils::formatNumber(*d);
    return std::get<std::string>(v);
}
}

const char* toString(TargetType type) {
    return type == TargetType::CLASSIFICATION ? "classification" : "regression";
}

namespace {
std::string quoteCsvField(const std::string& field, char delimiter) {
    const bool needsQuotes = field.find(delimiter) != std::string::npos ||
                             field.find('"') != std::string::npos ||
                             field.find('\n') != std::string::npos ||
                             field.find('\r') != std::string::npos;
    if (!needsQuotes) return field;

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char ch : field) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}
}

int Dataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) if (columns[i] == name) return static_cast<int>(i);
    return -1;
}

const CellValue& Dataset::at(size_t row, const std::string& column) const {
    const int idx = findColumnIndex(column);
    if (idx < 0) throw Curate::DatasetException("Unknown column: " + column);
    if (row >= rows.size()) throw Curate::DatasetException("Row index out of range: " + std::to_string(row));
    return rows[row][static_cast<size_t>(idx)];
}

std::vector<CellValue> Dataset::columnValues(const std::string& column) const {
    const int idx = findColumnIndex(column);
    if (idx < 0) throw Curate::DatasetException("Unknown column: " + column);
    std::vector<CellValue> out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(row[static_cast<size_t>(idx)]);
    return out;
}

void Dataset::writeCsv(std::ostream& out, char delimiter) const {
    for (size_t c = 0; c < columns.size(); ++c) {
        if (c) out << delimiter;
        out << quoteCsvField(columns[c], delimiter);
    }
    out << "\n";
    for (const auto& row : rows) {
        for (size_t c = 0; c < row.size(); ++c) {
            if (c) out << delimiter;
            out << quoteCsvField(CellValues::toString(row[c]), delimiter);
        }
        out << "\n";
    }
}

void Dataset::writeCsv(const std::string& path, char delimiter) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Curate::IOException("Could not open output file: " + path);
    writeCsv(out, delimiter);
    if (!out.good()) throw Curate::IOException("Failed while writing output file: " + path);
}
