#include <iostream>
#include <algorithm>
#include <CLI/CLI.hpp>
#include "gig.hpp"

#ifndef GIG_VERSION
#define GIG_VERSION "dev"
#endif

int main(int argc, char** argv) {
    try {
        CLI::App app{"Go imports grouper - A tool to group and sort Go imports\n\n"
                     "Imports are organized into groups:\n"
                     "  1. Go standard library\n"
                     "  2. Third-party packages\n"
                     "  3. Organization packages (--orgs, one group per prefix, split by project)\n"
                     "  4. Current project packages\n\n"
                     "PATH can be a single Go file or a directory, which is processed recursively."};
        app.name("gig");

        GigOptions options;
        bool showVersion = false;

        // File or directory to process
        app.add_option("path", options.inputPath, "Go source file or directory");

        app.add_option("--orgs", options.orgs,
                       "Comma-separated list of organization prefixes (e.g. github.com/myorg,github.com/acme-corp)")
            ->delimiter(',');

        app.add_option("--current-project", options.currentProject,
                       "Module path of the current project (default: read from go.mod)");

        app.add_flag("--in-place", options.inPlace, "Modify the files in place instead of printing to stdout");

        app.add_flag("--full", options.fullOutput,
                     "For a single file on stdout, print the whole rewritten file instead of only the package clause and imports");

        app.add_option("--exclude", options.excludePatterns,
                       "Comma-separated list of glob patterns for files or directories to skip (e.g. *_gen.go,testdata/)");

        app.add_option("--threads", options.numThreads, "Number of threads to use for directories (default: number of CPU cores)")
            ->check(CLI::Range(1u, 64u));

        app.add_option("--report", options.reportFile, "Write a JSON report of the processed files");

        app.add_flag("--verbose", options.verbose, "Enable verbose output");

        app.add_flag("-v,--version", showVersion, "Show version information");

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        if (showVersion) {
            std::cout << "Go Imports Group (GIG) version " << GIG_VERSION << std::endl;
            return 0;
        }

        if (options.inputPath.empty()) {
            std::cerr << "Error: PATH is required" << std::endl;
            std::cerr << app.help() << std::endl;
            return 1;
        }

        // "--orgs a,,b" or a trailing comma leaves empty entries behind
        options.orgs.erase(std::remove(options.orgs.begin(), options.orgs.end(), std::string()),
                           options.orgs.end());

        if (options.numThreads == 0) {
            options.numThreads = 1;
        }

        Gig gig(options);
        if (!gig.run()) {
            return 1;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
