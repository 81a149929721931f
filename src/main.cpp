#include <iostream>
#include <fstream>
#include <sstream>
#include <chrono>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "seo_analyzer.hpp"

using json = nlohmann::json;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<KeywordMapEntry> loadKeywordMap(const std::string& path) {
    json data = json::parse(readFile(path), nullptr, false);
    if (data.is_discarded()) {
        throw std::runtime_error("Failed to parse keyword map: " + path);
    }
    if (!data.is_array()) {
        throw std::invalid_argument("Keyword map must be a JSON array: " + path);
    }
    std::vector<KeywordMapEntry> entries;
    entries.reserve(data.size());
    for (const auto& item : data) {
        entries.push_back(KeywordMapEntry::fromJson(item));
    }
    return entries;
}

}

int main(int argc, char** argv) {
    try {
        CLI::App app{"seosignal - On-page SEO signal analysis for rendered HTML"};

        std::vector<std::string> inputFiles;
        std::string keywordMapFile;
        std::string configFile;
        std::string outputFile;
        AnalysisRequest request;
        unsigned int numThreads = 0;
        int indent = 2;
        bool verbose = false;

        app.add_option("-i,--input", inputFiles, "HTML file to analyze (may be repeated)")
            ->check(CLI::ExistingFile);
        app.add_option("-k,--keyword", request.primaryKeyword, "Primary keyword");
        app.add_option("-s,--secondary", request.secondaryKeywords, "Secondary keyword (may be repeated)");
        app.add_option("--local-keyword", request.localKeywords,
                       "Local keyword such as a city or service, used for schema type suggestions (may be repeated)");
        app.add_option("--post-type", request.postType, "Post type used as an intent prior (default: post)");
        auto* languageOption = app.add_option("-l,--language", request.language,
                                              "Content language (default: from config, else en)")
            ->check(CLI::IsMember({"en", "de", "fr", "zh", "ja", "ko", "zh-hans", "zh-hant"}));
        app.add_option("--url", request.url, "Page URL");
        app.add_option("--keyword-map", keywordMapFile, "JSON keyword map of the whole site")
            ->check(CLI::ExistingFile);
        app.add_option("-c,--config", configFile, "JSON configuration file")
            ->check(CLI::ExistingFile);
        app.add_option("-o,--output", outputFile, "Output file (default: stdout)");
        app.add_option("--threads", numThreads, "Number of threads for batch and site analysis (default: number of CPU cores)")
            ->check(CLI::Range(1u, 64u));
        app.add_option("--indent", indent, "JSON indentation (default: 2, -1 for compact)");
        app.add_flag("-v,--verbose", verbose, "Enable verbose output");

        CLI11_PARSE(app, argc, argv);

        if (inputFiles.empty() && keywordMapFile.empty()) {
            std::cerr << "Error: Nothing to analyze, give --input or --keyword-map" << std::endl;
            return 1;
        }

        SeoAnalyzerConfig config = configFile.empty() ? SeoAnalyzerConfig()
                                                      : SeoAnalyzerConfig::fromJsonFile(configFile);
        if (languageOption->count() == 0) {
            request.language = config.readability.defaultLanguage;
        }
        if (numThreads > 0) {
            config.numThreads = numThreads;
            config.keywordMap.numThreads = numThreads;
        }

        auto startTime = std::chrono::high_resolution_clock::now();
        SeoAnalyzer analyzer(config);
        json output;

        if (!inputFiles.empty()) {
            std::vector<BatchDocument> documents;
            for (const auto& path : inputFiles) {
                documents.push_back({path, readFile(path), request});
            }
            if (verbose) {
                std::cout << "Analyzing " << documents.size() << " document(s) with "
                          << config.numThreads << " thread(s)" << std::endl;
            }

            if (documents.size() == 1 && keywordMapFile.empty()) {
                output = analyzer.analyze(documents.front().html, request);
            } else {
                output["documents"] = analyzer.analyzeBatch(documents);
            }
        }

        if (!keywordMapFile.empty()) {
            std::vector<KeywordMapEntry> entries = loadKeywordMap(keywordMapFile);
            if (verbose) {
                std::cout << "Analyzing keyword map with " << entries.size() << " entries" << std::endl;
            }
            output["site"] = analyzer.analyzeSite(entries);
        }

        std::string rendered = output.dump(indent);
        if (outputFile.empty()) {
            std::cout << rendered << std::endl;
        } else {
            std::ofstream out(outputFile);
            if (!out) {
                throw std::runtime_error("Failed to open output file: " + outputFile);
            }
            out << rendered << std::endl;
            if (verbose) {
                std::cout << "Report written to " << outputFile << std::endl;
            }
        }

        if (verbose) {
            auto endTime = std::chrono::high_resolution_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);
            std::cout << "Completed in " << elapsed.count() << " ms" << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
