#pragma once
#include "Dataset.h"
#include "DatasetLimits.h"
#include "IngestionPipeline.h"
#include <ostream>
#include <vector>

class TerminalUI {
public:
    // Preview display
    static void printPreview(const PreviewResult& preview, std::ostream& out);
    static void printLimitViolations(const std::vector<LimitViolation>& violations, std::ostream& out);

    // Finalize display
    static void printDatasetSummary(const Dataset& dataset, std::ostream& out);
};
