#include "sid/detector/script_detector.hpp"
#include "sid/unicode/unicode_utils.hpp"
#include <iostream>
#include <vector>
#include <chrono>
#include <random>
#include <string>
#include <utility>
#include <optional>

namespace {

const size_t kExampleSize = 8 * 1024;

// Sample sentences with the script they are written in
const std::vector<std::pair<std::string, sid::Script>> kExamples = {
    {"The quick brown fox jumps over the lazy dog. ", sid::Script::Latin},
    {"Благодаря Эсперанто вы обретёте друзей по всему миру! ", sid::Script::Cyrillic},
    {"ككل حوالي 1.6، ومعظم الناس ", sid::Script::Arabic},
    {"県見夜上温国阪題富販 ", sid::Script::Mandarin},
    {"हिमालयी वन चिड़िया चिड़िया की एक प्रजाति है ", sid::Script::Devanagari},
    {"היסטוריה והתפתחות של האלפבית העברי ", sid::Script::Hebrew},
    {"ქართული ენა მსოფლიო ", sid::Script::Georgian},
    {"안녕하세요 세계 ", sid::Script::Hangul},
    {"ภาษาไทยเป็นภาษาราชการ ", sid::Script::Thai},
};

// Cycle the text's code points until it holds at least size code points
std::u32string extend_text(const std::string& text, size_t size) {
    std::u32string source = sid::unicode::to_code_points(text);
    std::u32string result;
    result.reserve(size + source.size());
    while (result.size() < size) {
        result += source;
    }
    return result;
}

// Latin text with random Cyrillic words sprinkled in, Latin stays the majority
std::u32string generate_mixed_text(size_t size) {
    const std::vector<std::u32string> latin = {U"language ", U"script ", U"detection ", U"unicode "};
    const std::vector<std::u32string> cyrillic = {U"язык ", U"письмо "};

    std::mt19937 gen(42);
    std::uniform_int_distribution<> pick(0, 9);
    std::u32string result;
    while (result.size() < size) {
        int roll = pick(gen);
        if (roll < 2) {
            result += cyrillic[roll];
        } else {
            result += latin[roll % latin.size()];
        }
    }
    return result;
}

template <typename F>
long long time_us(F&& f, int iterations) {
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        f();
    }
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / iterations;
}

bool run_performance_test() {
    std::cout << "=== Script Detector Performance Test ===\n";

    sid::DetectorConfig single_config;
    single_config.threads = 1;
    sid::ScriptDetector single(single_config);

    sid::DetectorConfig sharded_config;
    sharded_config.threads = 4;
    sharded_config.min_shard_size = 1024;
    sid::ScriptDetector sharded(sharded_config);

    bool ok = true;
    std::vector<size_t> sizes = {kExampleSize, 16 * kExampleSize, 128 * kExampleSize};

    for (size_t size : sizes) {
        std::cout << "\n--- Input size: " << size << " code points ---\n";

        for (const auto& [sentence, expected] : kExamples) {
            auto text = extend_text(sentence, size);

            std::optional<sid::Script> single_result;
            std::optional<sid::Script> sharded_result;
            auto single_us = time_us([&] { single_result = single.detect(text); }, 5);
            auto sharded_us = time_us([&] { sharded_result = sharded.detect(text); }, 5);

            std::cout << sid::script_name(expected) << ": single " << single_us << " us, "
                      << sharded.shard_count(text.size()) << " shards " << sharded_us << " us\n";

            if (single_result != expected || sharded_result != expected) {
                std::cout << "WARNING: Detection mismatch for " << sid::script_name(expected) << "\n";
                ok = false;
            }
        }

        // Latin majority with Cyrillic words scattered through every shard
        auto mixed = generate_mixed_text(size);
        std::optional<sid::Script> single_result;
        std::optional<sid::Script> sharded_result;
        auto single_us = time_us([&] { single_result = single.detect(mixed); }, 5);
        auto sharded_us = time_us([&] { sharded_result = sharded.detect(mixed); }, 5);
        std::cout << "Mixed: single " << single_us << " us, sharded " << sharded_us << " us\n";

        if (single_result != sharded_result || single_result != sid::Script::Latin) {
            std::cout << "WARNING: Mixed text results differ\n";
            ok = false;
        }
    }

    return ok;
}

} // namespace

int main() {
    try {
        if (!run_performance_test()) {
            std::cerr << "Performance test found mismatching results\n";
            return 1;
        }
        std::cout << "\n=== Performance Test Completed ===\n";
    } catch (const std::exception& e) {
        std::cerr << "Performance test failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
