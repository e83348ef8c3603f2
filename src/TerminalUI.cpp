#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
std::string clip(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(0, width);
    return s.substr(0, width - 3) + "...";
}

char flagGlyph(CellFlag flag) {
    switch (flag) {
        case CellFlag::MISSING: return '!';
        case CellFlag::PLACEHOLDER: return '?';
        case CellFlag::VALID: return ' ';
    }
    return ' ';
}
}

void TerminalUI::printPreview(const PreviewResult& preview, std::ostream& out) {
    size_t maxNameLen = 15;
    for (const auto& name : preview.columns) maxNameLen = std::max(maxNameLen, name.length());
    const int w = static_cast<int>(std::min<size_t>(maxNameLen, 32)) + 2;

    out << "\n============================================ COLUMN PROFILE ============================================\n";
    out << "[Curate] Raw rows: " << preview.rawRowCount
        << " | header at row " << preview.headerAbsoluteIndex
        << " | data starts at row " << preview.dataStartIndex << "\n\n";
    out << std::left
        << std::setw(w) << "Column"
        << std::setw(13) << "Type"
        << std::setw(10) << "Missing"
        << std::setw(14) << "Placeholders"
        << std::setw(10) << "Unique"
        << std::setw(10) << "Numeric" << "Examples\n";
    out << std::string(w + 13 + 10 + 14 + 10 + 10 + 10, '-') << "\n";

    for (size_t i = 0; i < preview.columns.size() && i < preview.stats.size(); ++i) {
        const ColumnStats& s = preview.stats[i];
        std::string numeric = "-";
        if (s.numericFraction) {
            std::ostringstream frac;
            frac << std::fixed << std::setprecision(2) << *s.numericFraction;
            numeric = frac.str();
        }
        std::string examples;
        for (size_t k = 0; k < s.examplePlaceholders.size(); ++k) {
            if (k) examples += ", ";
            examples += s.examplePlaceholders[k];
        }
        out << std::left
            << std::setw(w) << clip(preview.columns[i], static_cast<size_t>(w - 2))
            << std::setw(13) << ColumnProfiler::toString(s.inferredType)
            << std::setw(10) << s.missing
            << std::setw(14) << s.placeholders
            << std::setw(10) << s.unique
            << std::setw(10) << numeric << examples << "\n";
    }

    if (!preview.previewRows.empty()) {
        out << "\n[Curate] First " << preview.previewRows.size() << " raw rows ('!' missing, '?' placeholder):\n";
        for (size_t r = 0; r < preview.previewRows.size(); ++r) {
            std::string tag = "   ";
            if (r == preview.headerAbsoluteIndex) tag = "H  ";
            else if (r < preview.dataStartIndex) tag = "-  ";
            out << "  " << tag << std::right << std::setw(4) << r << " |";
            const auto& row = preview.previewRows[r];
            for (size_t c = 0; c < row.size(); ++c) {
                char glyph = ' ';
                if (r < preview.cellFlags.size() && c < preview.cellFlags[r].size() && r >= preview.dataStartIndex) {
                    glyph = flagGlyph(preview.cellFlags[r][c]);
                }
                out << " " << std::left << std::setw(14) << clip(row[c], 13) << glyph;
            }
            out << "\n";
        }
    }

    out << "=========================================================================================================\n";
    if (preview.hasLimitErrors()) printLimitViolations(preview.limitErrors, out);
}

void TerminalUI::printLimitViolations(const std::vector<LimitViolation>& violations, std::ostream& out) {
    if (violations.empty()) return;
    out << "\n[Curate][Warning] Dataset exceeds configured limits; finalize will be refused:\n";
    for (const auto& v : violations) {
        out << "        -> " << v.limit << ": " << v.message << "\n";
    }
}

void TerminalUI::printDatasetSummary(const Dataset& dataset, std::ostream& out) {
    const ImputationSummary& summary = dataset.imputationSummary;

    out << "\n============================================ DATASET SUMMARY ============================================\n";
    out << "[Curate] Target: \"" << dataset.target << "\" (" << toString(dataset.targetType);
    if (dataset.numClasses) out << ", " << *dataset.numClasses << " classes";
    out << ")\n";
    out << "[Curate] Samples: " << dataset.numSamples << " | Features: " << dataset.numFeatures << "\n";

    out << "\n    [Features]:\n";
    for (const auto& name : dataset.features) {
        out << "        - " << name << "\n";
    }

    out << "\n    [Imputation]:\n";
    out << "        Rows in: " << summary.originalRowCount
        << " | dropped: " << summary.droppedRowCount
        << " | kept: " << dataset.numSamples << "\n";
    if (summary.dropApplied) {
        out << "        Drop triggers:";
        if (summary.globalDrop) out << " [global drop-row]";
        if (summary.targetDrop) out << " [missing target]";
        for (const auto& col : summary.dropColumns) out << " [" << col << "]";
        out << "\n";
    }
    out << "=========================================================================================================\n";
}
