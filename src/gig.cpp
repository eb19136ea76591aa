#include "gig.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

Gig::Gig(const GigOptions& options)
    : options_(options) {

    // Default rules: *.go files, no vendor/ or hidden directories
    patternMatcher_ = std::make_unique<PatternMatcher>();

    // Apply exclude patterns if specified
    if (!options_.excludePatterns.empty()) {
        patternMatcher_->setExcludePatterns(options_.excludePatterns);

        if (options_.verbose) {
            std::cout << "Using exclude patterns: " << options_.excludePatterns << std::endl;
        }
    }

    fileProcessor_ = std::make_unique<FileProcessor>(*patternMatcher_, options_.numThreads);
}

FormatterConfig Gig::makeConfig() const {
    FormatterConfig config;
    config.orgPrefixes = options_.orgs;
    config.currentProject = options_.currentProject;
    config.inPlace = options_.inPlace;
    return config;
}

bool Gig::run() {
    const auto startTime = std::chrono::steady_clock::now();

    std::error_code ec;
    const auto status = fs::status(options_.inputPath, ec);
    if (ec || !fs::exists(status)) {
        throw std::runtime_error("failed to check path: " + options_.inputPath.string() +
                                 ": no such file or directory");
    }

    const bool ok = fs::is_directory(status) ? runDirectory() : runFile();

    duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    if (options_.verbose) {
        std::cout << "Completed in " << duration_.count() << " ms" << std::endl;
    }

    if (!options_.reportFile.empty()) {
        writeReport();
    }

    return ok;
}

bool Gig::runFile() {
    const FormatterConfig config = makeConfig();

    FileProcessor::FileResult result = fileProcessor_->processFile(options_.inputPath, config);

    if (options_.verbose) {
        std::cout << "current project: " << result.projectPrefix << std::endl;
    }

    batch_ = FileProcessor::BatchResult();
    if (result.processed) {
        ++batch_.successCount;
    } else {
        ++batch_.failureCount;
    }
    batch_.files.push_back(result);

    if (!result.processed) {
        std::cerr << "Error: " << result.error << std::endl;
        return false;
    }

    if (options_.inPlace) {
        if (options_.verbose) {
            std::cout << (result.written ? "Processed: " : "Unchanged: ") << result.path.string() << std::endl;
        }
        return true;
    }

    // Files without imports have no block to preview
    if (options_.fullOutput || result.importsOnly.empty()) {
        std::cout << result.output;
    } else {
        std::cout << result.importsOnly;
    }
    std::cout.flush();

    return true;
}

bool Gig::runDirectory() {
    // When processing directories, in-place mode is recommended
    if (!options_.inPlace) {
        std::cout << "Warning: Processing directory without --in-place flag. No files will be modified." << std::endl;
        std::cout << "Use --in-place flag to modify files or specify a single file for stdout output." << std::endl;
        std::cout << std::endl;
    }

    const std::vector<fs::path> files = fileProcessor_->collectFiles(options_.inputPath);

    if (files.empty()) {
        std::cout << "No Go files found in directory: " << options_.inputPath.string() << std::endl;
        batch_ = FileProcessor::BatchResult();
        return true;
    }

    std::cout << "Found " << files.size() << " Go files in directory: " << options_.inputPath.string() << std::endl;
    if (!options_.currentProject.empty()) {
        std::cout << "Current project: " << options_.currentProject << std::endl;
    }
    std::cout << std::endl;

    batch_ = fileProcessor_->processBatch(files, makeConfig());

    for (const auto& file : batch_.files) {
        if (!file.processed) {
            std::cout << "Error processing " << file.path.string() << ": " << file.error << std::endl;
        } else if (options_.inPlace) {
            std::cout << "Processed: " << file.path.string() << std::endl;
        } else if (options_.verbose && file.changed) {
            std::cout << "Would change: " << file.path.string() << std::endl;
        }
    }

    std::cout << getSummary() << std::endl;

    return batch_.failureCount == 0;
}

std::string Gig::getSummary() const {
    std::stringstream ss;
    ss << "\nProcessed " << batch_.successCount << " files successfully";
    if (batch_.failureCount > 0) {
        ss << ", " << batch_.failureCount << " files had errors";
    }
    return ss.str();
}

std::string Gig::getReport() const {
    json report;

    json configJson;
    configJson["orgs"] = options_.orgs;
    configJson["currentProject"] = options_.currentProject;
    configJson["inPlace"] = options_.inPlace;
    report["config"] = configJson;

    json filesJson = json::array();
    size_t changedFiles = 0;
    for (const auto& file : batch_.files) {
        json fileJson;
        fileJson["path"] = file.path.string();
        fileJson["status"] = file.processed ? "ok" : "error";
        if (file.processed) {
            fileJson["project"] = file.projectPrefix;
            fileJson["imports"] = file.importCount;
            json groupsJson = json::object();
            for (const auto& group : file.groups) {
                groupsJson[group.first] = group.second;
            }
            fileJson["groups"] = groupsJson;
            fileJson["changed"] = file.changed;
            fileJson["written"] = file.written;
        } else {
            fileJson["error"] = file.error;
        }
        if (file.changed) {
            changedFiles++;
        }
        filesJson.push_back(fileJson);
    }
    report["files"] = filesJson;

    report["summary"] = {
        {"total_files", batch_.files.size()},
        {"processed_files", batch_.successCount},
        {"failed_files", batch_.failureCount},
        {"changed_files", changedFiles},
        {"duration_ms", duration_.count()}
    };

    return report.dump(2);
}

void Gig::writeReport() const {
    std::ofstream reportFile(options_.reportFile);
    if (!reportFile) {
        std::cerr << "Error: Failed to write report to " << options_.reportFile.string() << std::endl;
        return;
    }

    reportFile << getReport() << std::endl;
    if (options_.verbose) {
        std::cout << "Report written to " << options_.reportFile.string() << std::endl;
    }
}
