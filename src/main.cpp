#include <ocr_layout/dump_catalog.h>
#include <ocr_layout/entity_extractor.h>
#include <ocr_layout/json_serializer.h>
#include <ocr_layout/ocr_extractor.h>
#include <ocr_layout/recognition_engine.h>
#include <ocr_layout/text_normalizer.h>
#include <ocr_layout/text_statistics.h>
#include <ocr_layout/token_dump_engine.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace ocr_layout;

struct CLIOptions {
    std::string input_path;
    std::string output_path;
    std::string language = "eng";
    std::string profile = "default";
    std::string mode = "text";
    double threshold = OcrExtractor::kDefaultThreshold;
    int thread_count = 0;  // 0 = auto
    bool clean = false;
    bool fix_confusions = true;
    bool entities = false;
    bool statistics = false;
    bool verbose = false;
    bool quiet = false;
    bool list_profiles = false;
    bool list_languages = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input PATH           Token dump (.tsv or .json) or a directory of dumps\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output PATH          Output JSON file, or directory for directory input\n";
    std::cout << "                             (default: <input>_ocr.json / ./out)\n";
    std::cout << "  -l, --lang CODE            Recognition language (default: eng)\n";
    std::cout << "  -p, --profile NAME         Recognition profile (default: default)\n";
    std::cout << "  -t, --threshold N          Minimum token confidence, 0-100 (default: 60)\n";
    std::cout << "  -m, --mode MODE            text | long | paragraphs | boxes | detect (default: text)\n";
    std::cout << "  --clean                    Add normalized text\n";
    std::cout << "  --keep-digits              With --clean, skip the 0->O / 1->l substitutions\n";
    std::cout << "  --entities                 Add emails, phone numbers, urls, numbers and dates\n";
    std::cout << "  --stats                    Add character/word/sentence/paragraph counts\n";
    std::cout << "  --threads N                Worker threads for directory input (default: auto)\n";
    std::cout << "  --list-profiles            Print recognition profiles and exit\n";
    std::cout << "  --list-languages           Print language codes and exit\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  tesseract scan.png scan tsv && " << program_name << " -i scan.tsv --entities\n";
    std::cout << "  " << program_name << " -i dumps/ -o out/ --mode paragraphs --stats\n";
}

void print_version() {
    std::cout << "ocr_layout ocr_layout_cli version 1.0.0\n";
    std::cout << "Built with C++17 and nlohmann/json\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:l:p:t:m:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"lang", required_argument, nullptr, 'l'},
        {"profile", required_argument, nullptr, 'p'},
        {"threshold", required_argument, nullptr, 't'},
        {"mode", required_argument, nullptr, 'm'},
        {"clean", no_argument, nullptr, 1001},
        {"keep-digits", no_argument, nullptr, 1002},
        {"entities", no_argument, nullptr, 1003},
        {"stats", no_argument, nullptr, 1004},
        {"threads", required_argument, nullptr, 1005},
        {"list-profiles", no_argument, nullptr, 1006},
        {"list-languages", no_argument, nullptr, 1007},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1008},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_path = optarg;
                break;
            case 'o':
                options.output_path = optarg;
                break;
            case 'l':
                options.language = optarg;
                break;
            case 'p':
                options.profile = optarg;
                break;
            case 't':
                options.threshold = std::stod(optarg);
                if (options.threshold < 0 || options.threshold > 100) {
                    throw std::invalid_argument("threshold must be between 0 and 100");
                }
                break;
            case 'm':
                options.mode = optarg;
                break;
            case 1001:  // clean
                options.clean = true;
                break;
            case 1002:  // keep-digits
                options.fix_confusions = false;
                break;
            case 1003:  // entities
                options.entities = true;
                break;
            case 1004:  // stats
                options.statistics = true;
                break;
            case 1005:  // threads
                options.thread_count = std::stoi(optarg);
                if (options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case 1006:
                options.list_profiles = true;
                return options;
            case 1007:
                options.list_languages = true;
                return options;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1008:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_path.empty()) {
        throw std::invalid_argument("Input path is required");
    }

    const std::vector<std::string> modes = {"text", "long", "paragraphs", "boxes", "detect"};
    if (std::find(modes.begin(), modes.end(), options.mode) == modes.end()) {
        throw std::invalid_argument("Unknown mode: " + options.mode);
    }

    if (!RecognitionProfiles::contains(options.profile)) {
        throw std::invalid_argument("Unknown profile: " + options.profile);
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

// Everything the CLI reports for one input
nlohmann::json process_input(OcrExtractor& extractor, const std::string& input,
                             const CLIOptions& options,
                             const TextNormalizer& normalizer,
                             const EntityExtractor& entity_extractor) {
    nlohmann::json output;
    output["input"] = input;

    if (options.mode == "boxes") {
        output["words"] = extractor.extract_text_with_boxes(input, options.language, options.profile);
        return output;
    }
    if (options.mode == "detect") {
        std::string code = extractor.detect_language(input);
        output["language"] = code;
        output["language_name"] = Languages::name_of(code);
        return output;
    }

    ExtractionResult result;
    if (options.mode == "long") {
        result = extractor.extract_long_text(input, options.language, options.threshold);
    } else if (options.mode == "paragraphs") {
        result = extractor.extract_text_optimized_for_paragraphs(input, options.language, options.threshold);
    } else {
        result = extractor.extract_text(input, options.language, options.profile, options.threshold);
    }

    output["result"] = result;
    if (!result.success) {
        return output;
    }

    if (options.clean) {
        output["cleaned_text"] = normalizer.clean(result.text);
    }
    if (options.entities) {
        output["structured_data"] = entity_extractor.extract(result.text);
    }
    if (options.statistics) {
        output["statistics"] = get_word_count(result.text);
    }

    return output;
}

void write_json(const nlohmann::json& document, const fs::path& path) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << JsonSerializer::serialize(document);
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (options.version) {
            print_version();
            return 0;
        }
        if (options.list_profiles) {
            for (const auto& [name, flags] : RecognitionProfiles::all()) {
                std::cout << std::setw(18) << std::left << name << flags << "\n";
            }
            return 0;
        }
        if (options.list_languages) {
            for (const auto& [code, name] : Languages::all()) {
                std::cout << std::setw(14) << std::left << code << name << "\n";
            }
            return 0;
        }

        if (!fs::exists(options.input_path)) {
            throw std::runtime_error("Input path not found: " + options.input_path);
        }
        if (!Languages::is_supported(options.language) && !options.quiet) {
            std::cerr << "Warning: unknown language code '" << options.language << "'\n";
        }

        ExtractorOptions extractor_opts;
        extractor_opts.verbose = options.verbose;
        if (options.thread_count > 0) {
            extractor_opts.thread_count = options.thread_count;
        }

        NormalizeOptions normalize_opts;
        normalize_opts.fix_ocr_confusions = options.fix_confusions;

        OcrExtractor extractor(std::make_shared<TokenDumpEngine>(), extractor_opts);
        TextNormalizer normalizer(normalize_opts);
        EntityExtractor entity_extractor;

        auto start = std::chrono::high_resolution_clock::now();

        if (fs::is_regular_file(options.input_path)) {
            fs::path output_path = options.output_path;
            if (output_path.empty()) {
                fs::path input(options.input_path);
                fs::path dir = input.parent_path().empty() ? fs::path(".") : input.parent_path();
                output_path = DumpCatalog::output_path(input, dir, dir);
            }

            auto output = process_input(extractor, options.input_path, options,
                                        normalizer, entity_extractor);
            write_json(output, output_path);

            bool failed = output.contains("result") && !output["result"]["success"].get<bool>();
            auto end = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

            if (options.quiet) {
                std::cout << (failed ? "FAILED|" : "SUCCESS|") << options.input_path << "|"
                          << duration.count() << "\n";
            } else {
                std::cout << (failed ? "✗ " : "✓ ") << options.input_path << " -> " << output_path
                          << " (" << duration.count() << "ms)\n";
            }
            return failed ? 1 : 0;
        }

        // Directory input; reports from earlier runs are never read back
        fs::path output_dir = options.output_path.empty() ? fs::path("./out") : fs::path(options.output_path);
        auto dumps = DumpCatalog::collect(options.input_path, output_dir);
        if (dumps.empty()) {
            std::cout << "No token dumps found in " << options.input_path << std::endl;
            return 0;
        }

        fs::create_directories(output_dir);

        if (!options.quiet) {
            std::cout << "Found " << dumps.size() << " token dumps to process\n";
            std::cout << "  Threads: " << (options.thread_count > 0 ?
                std::to_string(options.thread_count) : "auto (" +
                std::to_string(std::thread::hardware_concurrency()) + ")") << "\n";
        }

        size_t success_count = 0;
        if (options.mode == "text") {
            auto results = extractor.extract_batch(dumps, options.language, options.profile,
                options.threshold, [&options](size_t current, size_t total) {
                    if (!options.quiet) {
                        std::cout << "\rProgress: " << current << "/" << total
                                  << " (" << (100 * current / total) << "%)" << std::flush;
                    }
                });
            if (!options.quiet) {
                std::cout << std::endl;
            }

            for (size_t i = 0; i < results.size(); ++i) {
                nlohmann::json output;
                output["input"] = dumps[i];
                output["result"] = results[i];
                if (results[i].success) {
                    if (options.clean) {
                        output["cleaned_text"] = normalizer.clean(results[i].text);
                    }
                    if (options.entities) {
                        output["structured_data"] = entity_extractor.extract(results[i].text);
                    }
                    if (options.statistics) {
                        output["statistics"] = get_word_count(results[i].text);
                    }
                    success_count++;
                }
                write_json(output, DumpCatalog::output_path(dumps[i], options.input_path, output_dir));
            }
        } else {
            for (const auto& dump : dumps) {
                auto output = process_input(extractor, dump, options, normalizer, entity_extractor);
                if (!output.contains("result") || output["result"]["success"].get<bool>()) {
                    success_count++;
                }
                write_json(output, DumpCatalog::output_path(dump, options.input_path, output_dir));
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (!options.quiet) {
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Successfully processed: " << success_count << "/" << dumps.size() << " dumps\n";
            std::cout << "Total time: " << duration.count() << "ms\n";
            auto stats = extractor.get_stats();
            std::cout << "Tokens processed: " << stats["tokens_processed"] << "\n";
            if (stats.contains("average_processing_time_ms")) {
                std::cout << "Average per dump: " << std::fixed << std::setprecision(1)
                          << stats["average_processing_time_ms"].get<double>() << "ms\n";
            }
            std::cout << "Output saved to: " << output_dir << "\n";
        } else {
            std::cout << "SUCCESS|" << options.input_path << "|" << success_count << "|"
                      << dumps.size() << "|" << duration.count() << "\n";
        }

        return success_count == dumps.size() ? 0 : 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Error: Unknown error occurred\n";
        return 1;
    }
}
