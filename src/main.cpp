#include "AppConfig.h"
#include "CurateExceptions.h"
#include "IngestionSession.h"
#include "TerminalUI.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
std::string readWholeFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Curate::IOException("Could not open file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw Curate::IOException("Failed while reading file: " + path);
    }
    return buffer.str();
}
}

int main(int argc, char* argv[]) {
    try {
        AppConfig config = AppConfig::fromArgs(argc, argv);

        if (config.verbose) {
            std::cout << "[Curate] Loading " << config.datasetPath << "\n";
        }
        std::string text = readWholeFile(config.datasetPath);

        IngestionSession session(IngestionPipeline(csvRowSplitter(config.delimiter), config.limits), config.ingestion);
        session.setVerbose(config.verbose);
        session.loadRawText(std::move(text));

        if (session.error()) {
            std::cerr << "[Curate Error] " << *session.error() << "\n";
            return 1;
        }
        if (session.preview()) {
            TerminalUI::printPreview(*session.preview(), std::cout);
        }
        if (config.previewOnly) {
            return 0;
        }

        FinalizeResult result = session.finalize();
        if (!result.ok()) {
            std::cerr << "[Curate Error] " << result.error << "\n";
            return 1;
        }

        TerminalUI::printDatasetSummary(*result.dataset, std::cout);

        if (!config.exportPath.empty()) {
            result.dataset->writeCsv(config.exportPath, config.delimiter);
            std::cout << "[Curate] Dataset written to " << config.exportPath << "\n";
        }
    } catch (const Curate::ConfigurationException& e) {
        std::cerr << "[Curate Error] " << e.what() << "\n";
        std::cerr << AppConfig::usage() << "\n";
        return 1;
    } catch (const Curate::CurateException& e) {
        std::cerr << "[Curate Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Curate Exception] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
