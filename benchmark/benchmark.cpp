#include <benchmark/benchmark.h>
#include <ocr_layout/entity_extractor.h>
#include <ocr_layout/line_assembler.h>
#include <ocr_layout/ocr_extractor.h>
#include <ocr_layout/paragraph_assembler.h>
#include <ocr_layout/text_normalizer.h>

using namespace ocr_layout;

namespace {

const char* const kWords[] = {
    "The", "quick", "brown", "fox", "jumps", "over", "the", "lazy", "dog.",
    "Invoice", "12/03/2024", "total", "1234.50", "contact", "billing@example.com"
};

// A page of `lines` rows with 12 words each, in raster order with a little vertical jitter
std::vector<Token> synthetic_page(int lines) {
    std::vector<Token> tokens;
    tokens.reserve(static_cast<size_t>(lines) * 12);

    size_t word = 0;
    for (int row = 0; row < lines; ++row) {
        for (int col = 0; col < 12; ++col) {
            Token token;
            token.text = kWords[word++ % (sizeof(kWords) / sizeof(kWords[0]))];
            token.confidence = 50.0 + (row * 7 + col * 3) % 50;
            token.x = 10 + col * 60;
            token.y = 10 + row * 30 + (col % 3);
            token.width = 55;
            token.height = 20;
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

std::string synthetic_document(int lines) {
    LineAssembler assembler;
    std::string text;
    for (const auto& line : assembler.assemble_text(synthetic_page(lines))) {
        text += line;
        text += '\n';
    }
    return text;
}

class SyntheticEngine : public RecognitionEngine {
public:
    explicit SyntheticEngine(int lines) : tokens_(synthetic_page(lines)) {}

    std::vector<Token> recognize(const std::string&, const std::string&, const std::string&) override {
        return tokens_;
    }

private:
    std::vector<Token> tokens_;
};

} // namespace

static void BM_LineAssembly(benchmark::State& state) {
    auto tokens = synthetic_page(static_cast<int>(state.range(0)));
    LineAssembler assembler;

    for (auto _ : state) {
        auto lines = assembler.assemble(tokens);
        benchmark::DoNotOptimize(lines);
    }

    state.counters["tokens"] = static_cast<double>(tokens.size());
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(tokens.size()));
}
BENCHMARK(BM_LineAssembly)->Range(8, 512);

static void BM_DocumentReflow(benchmark::State& state) {
    auto text = synthetic_document(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        auto reflowed = ParagraphAssembler::reflow_document(text);
        benchmark::DoNotOptimize(reflowed);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_DocumentReflow)->Range(8, 512);

static void BM_CleanText(benchmark::State& state) {
    auto text = synthetic_document(static_cast<int>(state.range(0)));
    TextNormalizer normalizer;

    for (auto _ : state) {
        auto cleaned = normalizer.clean(text);
        benchmark::DoNotOptimize(cleaned);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_CleanText)->Range(8, 512);

static void BM_EntityExtraction(benchmark::State& state) {
    auto text = synthetic_document(static_cast<int>(state.range(0)));
    EntityExtractor extractor;

    for (auto _ : state) {
        auto data = extractor.extract(text);
        benchmark::DoNotOptimize(data);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_EntityExtraction)->Range(8, 128);

static void BM_BatchExtraction(benchmark::State& state) {
    ExtractorOptions options;
    options.thread_count = static_cast<size_t>(state.range(0));
    OcrExtractor extractor(std::make_shared<SyntheticEngine>(64), options);

    std::vector<std::string> images(static_cast<size_t>(state.range(1)), "page");

    for (auto _ : state) {
        auto results = extractor.extract_batch(images);
        benchmark::DoNotOptimize(results);
    }

    auto stats = extractor.get_stats();
    state.counters["avg_ms"] = stats["average_processing_time_ms"].get<double>();
    state.counters["documents"] = static_cast<double>(images.size());
}
BENCHMARK(BM_BatchExtraction)->Ranges({{1, 8}, {1, 32}});

BENCHMARK_MAIN();
