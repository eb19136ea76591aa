#include "file_processor.hpp"
#include <fstream>
#include <algorithm>
#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include "go_syntax.hpp"
#include "import_emitter.hpp"
#include "project_resolver.hpp"

namespace {

const char* const ERR_READ_FILE = "failed to read file";
const char* const ERR_PARSE_FILE = "failed to parse file";
const char* const ERR_FORMAT_FILE = "failed to format file";
const char* const ERR_WRITE_FILE = "failed to write file";

// Suffix of the temporary file used for in-place writes
const std::string TEMP_SUFFIX = ".gig.tmp";

} // namespace

FileProcessor::FileProcessor(const PatternMatcher& patternMatcher, unsigned int numThreads)
    : patternMatcher_(patternMatcher),
      numThreads_(numThreads == 0 ? 1 : numThreads) {
}

FileProcessor::~FileProcessor() {
    // Make sure threads are joined
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

FileProcessor::FileResult FileProcessor::processFile(const fs::path& filePath,
                                                     const FormatterConfig& config) const {
    FileResult result;
    result.path = filePath;

    try {
        const std::string source = readFile(filePath);

        result.projectPrefix = resolveProjectPrefix(filePath, config);
        ImportGrouper grouper(config.orgPrefixes, result.projectPrefix);

        rewrite(source, grouper, result);

        if (config.inPlace && result.changed) {
            writeFileAtomically(filePath, result.output);
            result.written = true;
        }

        result.processed = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    return result;
}

std::string FileProcessor::transform(const std::string& source, const ImportGrouper& grouper) const {
    FileResult result;
    rewrite(source, grouper, result);
    return result.output;
}

void FileProcessor::rewrite(const std::string& source, const ImportGrouper& grouper,
                            FileResult& result) const {
    GoParser parser;

    SyntaxTree tree;
    try {
        tree = parser.parse(source);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string(ERR_PARSE_FILE) + ": " + e.what());
    }

    // Nothing to group: leave the file exactly as it is
    if (tree.importCount() == 0) {
        result.output = source;
        result.changed = false;
        return;
    }

    std::vector<Import> imports = extractImports(tree);
    result.importCount = imports.size();

    const GroupedImports grouped = grouper.group(std::move(imports));
    for (const auto& entry : grouped) {
        result.groups.emplace_back(entry.first.name(), entry.second.size());
    }

    ImportEmitter emitter;
    const SyntaxTree rebuilt = emitter.rebuild(tree, grouped);
    std::string output = printSource(rebuilt);

    if (!parser.isValid(output)) {
        throw std::runtime_error(std::string(ERR_FORMAT_FILE) + ": rewritten source is not valid Go");
    }

    result.importsOnly = emitter.renderImportsOnly(rebuilt);
    result.changed = output != source;
    result.output = std::move(output);
}

FileProcessor::BatchResult FileProcessor::processBatch(const std::vector<fs::path>& filePaths,
                                                       const FormatterConfig& config) {
    BatchResult batch;
    batch.files.resize(filePaths.size());

    if (!filePaths.empty()) {
        fileQueue_ = std::queue<size_t>();
        for (size_t i = 0; i < filePaths.size(); ++i) {
            fileQueue_.push(i);
        }

        // Use at most numThreads_ or filePaths.size() threads
        const unsigned int actualThreads =
            std::min(numThreads_, static_cast<unsigned int>(filePaths.size()));
        workers_.clear();

        try {
            for (unsigned int i = 0; i < actualThreads; ++i) {
                workers_.emplace_back(&FileProcessor::workerThread, this,
                                      std::cref(filePaths), std::cref(config), std::ref(batch.files));
            }
        } catch (const std::system_error& e) {
            // Whatever is left in the queue is picked up by the running
            // workers or by the loop below
            std::cerr << "Warning: Could not create worker thread: " << e.what() << std::endl;
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        // Anything no worker picked up (thread creation failed) runs here
        workerThread(filePaths, config, batch.files);
    }

    for (const auto& file : batch.files) {
        if (file.processed) {
            ++batch.successCount;
        } else {
            ++batch.failureCount;
        }
    }

    return batch;
}

void FileProcessor::workerThread(const std::vector<fs::path>& filePaths,
                                 const FormatterConfig& config,
                                 std::vector<FileResult>& results) {
    while (true) {
        size_t index;

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (fileQueue_.empty()) {
                return;
            }
            index = fileQueue_.front();
            fileQueue_.pop();
        }

        // Each index is owned by exactly one worker
        results[index] = processFile(filePaths[index], config);
    }
}

std::vector<fs::path> FileProcessor::collectFiles(const fs::path& dir) const {
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw std::runtime_error("Invalid directory: " + dir.string());
    }

    std::vector<fs::path> files;

    auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const fs::path relative = it->path().lexically_relative(dir);

        if (it->is_directory()) {
            if (patternMatcher_.isIgnoredDirectory(relative)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (it->is_regular_file() && patternMatcher_.shouldProcess(relative)) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string FileProcessor::resolveProjectPrefix(const fs::path& filePath,
                                                const FormatterConfig& config) const {
    if (!config.currentProject.empty()) {
        return config.currentProject;
    }
    return ProjectResolver().resolve(filePath);
}

std::string FileProcessor::readFile(const fs::path& filePath) const {
    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) {
        throw std::runtime_error(std::string(ERR_READ_FILE) + ": " + filePath.string() +
                                 ": not a regular file");
    }

    const uintmax_t fileSize = fs::file_size(filePath, ec);
    if (ec) {
        throw std::runtime_error(std::string(ERR_READ_FILE) + ": " + filePath.string() + ": " + ec.message());
    }
    if (fileSize > MAX_FILE_SIZE) {
        throw std::runtime_error(std::string(ERR_READ_FILE) + ": " + filePath.string() + ": file too large");
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error(std::string(ERR_READ_FILE) + ": failed to open " + filePath.string());
    }

    std::string content;
    content.reserve(static_cast<size_t>(fileSize));
    content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

    if (file.bad()) {
        throw std::runtime_error(std::string(ERR_READ_FILE) + ": I/O error reading " + filePath.string());
    }

    return content;
}

void FileProcessor::writeFileAtomically(const fs::path& filePath, const std::string& content) const {
    fs::path tempPath = filePath;
    tempPath += TEMP_SUFFIX;

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error(std::string(ERR_WRITE_FILE) + ": cannot create " + tempPath.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error(std::string(ERR_WRITE_FILE) + ": write to " + tempPath.string() + " failed");
        }
    }

    std::error_code ec;
    const auto perms = fs::status(filePath, ec).permissions();
    if (!ec) {
        fs::permissions(tempPath, perms, ec);
    }

    fs::rename(tempPath, filePath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error(std::string(ERR_WRITE_FILE) + ": " + filePath.string() + ": " + ec.message());
    }
}
