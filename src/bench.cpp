#include "subalign/subalign.hpp"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static bool flag_markdown = false;
static int flag_max_entries = 1000;
static int flag_dim = 64;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--max-entries="))
            flag_max_entries = std::stoi(arg.substr(14));
        else if (arg.starts_with("--dim="))
            flag_dim = std::stoi(arg.substr(6));
        else if (arg == "--markdown")
            flag_markdown = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Parse entry count from benchmark name like "merge_synced/200/real_time"
static int parse_entries(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return 0;
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    if (arg_str.empty() ||
        !std::all_of(arg_str.begin(), arg_str.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
        return 0;
    return std::stoi(arg_str);
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Benchmark | Entries | Time (ms) | Entries/s |\n";
        std::cout << "|-----------|---------|-----------|-----------|\n";

        for (const auto &r : runs_) {
            if (r.skipped != benchmark::internal::NotSkipped)
                continue;

            std::string name = r.benchmark_name();
            int entries = parse_entries(name);
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double rate = time_ms > 0 ? entries / (time_ms / 1000.0) : 0;

            std::cout << "| " << name.substr(0, name.find('/')) << " | "
                      << entries << " | " << std::fixed
                      << std::setprecision(2) << time_ms << " | "
                      << std::setprecision(0) << rate << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Hashing embedder ───────────────────────────────────────────────────────

// Bag of lowercased words hashed into a fixed number of buckets. Stands in
// for a sentence model so the benchmark measures the engine alone.
class HashEmbedder : public subalign::EmbeddingProvider {
  public:
    explicit HashEmbedder(int dim) : dim_(dim) {}

    std::vector<std::vector<float>>
    embed(const std::vector<std::string> &batch) override {
        std::vector<std::vector<float>> out;
        out.reserve(batch.size());
        for (const auto &text : batch) {
            std::vector<float> v(static_cast<size_t>(dim_), 0.0f);
            v[0] = 0.05f; // keeps empty strings embeddable
            std::string word;
            auto flush = [&]() {
                if (word.empty())
                    return;
                v[1 + fnv1a(word) % static_cast<uint32_t>(dim_ - 1)] += 1.0f;
                word.clear();
            };
            for (char c : text) {
                if (std::isalnum(static_cast<unsigned char>(c)))
                    word += static_cast<char>(
                        std::tolower(static_cast<unsigned char>(c)));
                else
                    flush();
            }
            flush();
            out.push_back(std::move(v));
        }
        return out;
    }

  private:
    int dim_;

    static uint32_t fnv1a(const std::string &s) {
        uint32_t h = 2166136261u;
        for (unsigned char c : s) {
            h ^= c;
            h *= 16777619u;
        }
        return h;
    }
};

// ─── Synthetic tracks ───────────────────────────────────────────────────────

static const char *const VOCAB[] = {
    "river", "lantern", "harbor", "winter", "orchard", "signal", "copper",
    "meadow", "thunder", "velvet", "compass", "glacier", "ember", "saddle",
    "marble", "falcon", "canyon", "willow", "anchor", "pepper",
};
static constexpr int VOCAB_SIZE = sizeof(VOCAB) / sizeof(VOCAB[0]);

static std::string sentence(int i) {
    std::string s;
    for (int k = 0; k < 4; ++k) {
        if (k)
            s += ' ';
        s += VOCAB[(i * 7 + k * 3 + i / VOCAB_SIZE) % VOCAB_SIZE];
    }
    return s + ".";
}

static std::string shout(std::string s) {
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Secondary track carries the same sentences upper-cased with shifted timing;
// every extra_every-th primary entry has no counterpart (0 = none).
static void make_tracks(int n, int extra_every, subalign::Track &primary,
                        subalign::Track &secondary) {
    primary = {};
    secondary = {};
    int t = 0;
    for (int i = 0; i < n; ++i) {
        subalign::SubtitleEntry p;
        p.start = t;
        p.end = t + 1800;
        p.style = "Default";
        bool extra = extra_every > 0 && i % extra_every == extra_every - 1;
        p.text = extra ? "unrelated aside number " + std::to_string(i)
                       : sentence(i);
        primary.entries.push_back(p);

        if (!extra) {
            subalign::SubtitleEntry s;
            s.start = t + 150;
            s.end = t + 1900;
            s.style = "Secondary";
            s.text = shout(sentence(i));
            secondary.entries.push_back(s);
        }
        t += 2000;
    }
    primary.styles = {{"Default", ""}};
    secondary.styles = {{"Secondary", ""}};
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static void add_entry_args(benchmark::Benchmark *b) {
    for (int n = 25; n <= flag_max_entries; n *= 4)
        b->Arg(n);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    benchmark::RegisterBenchmark("tokenize", [](benchmark::State &state) {
        subalign::Track primary, secondary;
        make_tracks(static_cast<int>(state.range(0)), 0, primary, secondary);
        subalign::Tokenizer tokenizer(subalign::TokenRule::SpaceSeparated);
        for (auto _ : state) {
            auto entries = primary.entries;
            tokenizer.tokenize(entries);
            benchmark::DoNotOptimize(entries.data());
        }
        state.counters["Entries"] = benchmark::Counter(
            static_cast<double>(state.range(0)), benchmark::Counter::kIsRate);
    })->Apply(add_entry_args);

    auto reg_merge = [](const std::string &name, subalign::MergeConfig config,
                        int extra_every) {
        benchmark::RegisterBenchmark(
            name, [config, extra_every](benchmark::State &state) {
                subalign::Track primary, secondary;
                make_tracks(static_cast<int>(state.range(0)), extra_every,
                            primary, secondary);
                HashEmbedder embedder(flag_dim);
                subalign::Merger merger(embedder, config);

                size_t fields = 0;
                for (auto _ : state) {
                    auto result = merger.merge(primary, secondary);
                    fields = result.fields.size();
                    benchmark::DoNotOptimize(result.fields.data());
                }

                state.counters["Fields"] = static_cast<double>(fields);
                state.counters["Entries"] =
                    benchmark::Counter(static_cast<double>(state.range(0)),
                                       benchmark::Counter::kIsRate);
            })->Apply(add_entry_args);
    };

    reg_merge("merge_synced", subalign::make_synced_config(), 0);
    reg_merge("merge_cuts", subalign::make_cuts_config(), 10);

    // Force the banded DTW path on every size
    auto banded = subalign::make_synced_config();
    banded.dtw.full_matrix_limit = 0;
    banded.dtw.band_radius = 16;
    reg_merge("merge_banded", banded, 0);
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    if (flag_max_entries < 25 || flag_dim < 2) {
        std::cerr
            << "Usage: subalign_bench [options] [benchmark flags]\n\n"
            << "Options:\n"
            << "  --max-entries=N     Largest track size (>= 25, default 1000)\n"
            << "  --dim=N             Embedding dimension (>= 2, default 64)\n"
            << "  --markdown          Output as markdown table\n"
            << "\nGoogle Benchmark flags (passed through):\n"
            << "  --benchmark_filter=REGEX\n"
            << "  --benchmark_repetitions=N\n"
            << "  --benchmark_format={console|json|csv}\n"
            << std::endl;
        return 1;
    }

    benchmark::Initialize(&argc, argv);
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
