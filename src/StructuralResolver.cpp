#include "StructuralResolver.h"
#include "CommonUtils.h"
#include "CurateExceptions.h"
#include <unordered_map>
#include <unordered_set>

std::vector<std::string> ResolvedHeader::names() const {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

int ResolvedHeader::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) if (columns[i].name == name) return static_cast<int>(i);
    return -1;
}

namespace StructuralResolver {
const std::string& cellAt(const CSVUtils::RawRow& row, size_t index) {
    static const std::string kEmpty;
    return index < row.size() ? row[index] : kEmpty;
}

std::vector<std::string> deduplicateNames(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_map<std::string, size_t> seen;
    std::unordered_set<std::string> used;

    for (const auto& raw : header) {
        std::string base = CommonUtils::trim(raw);
        if (base.empty()) base = "col";
        size_t count = seen[base]++;
        std::string name = count == 0 ? base : base + "_" + std::to_string(count);
        // A literal "x_1" in the header can collide with a generated suffix.
        while (used.find(name) != used.end()) {
            count = seen[base]++;
            name = base + "_" + std::to_string(count);
        }
        used.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}

ResolvedHeader resolve(const CSVUtils::RawRows& rows, size_t skipRows, size_t headerRow) {
    if (rows.empty()) {
        throw Curate::StructuralException("No rows found");
    }
    if (skipRows >= rows.size()) {
        throw Curate::StructuralException("skipRows (" + std::to_string(skipRows) + ") >= total rows (" +
                                          std::to_string(rows.size()) + ")");
    }
    if (headerRow >= rows.size() - skipRows) {
        throw Curate::StructuralException("headerRow (" + std::to_string(headerRow) +
                                          ") is out of range after skipping " + std::to_string(skipRows) + " rows");
    }

    ResolvedHeader out;
    out.headerAbsoluteIndex = skipRows + headerRow;
    out.dataStartIndex = out.headerAbsoluteIndex + 1;

    const auto names = deduplicateNames(rows[out.headerAbsoluteIndex]);
    out.columns.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        out.columns.push_back(Column{names[i], i});
    }
    return out;
}
}
