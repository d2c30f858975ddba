/**
 * @file bench_frame_decoder.cpp
 * @brief Benchmarks for decoding and classifying the status stream
 */

#include <benchmark/benchmark.h>

#include <kcenon/xdcc_client/core/frame_decoder.h>
#include <kcenon/xdcc_client/protocol/message_classifier.h>

#include <algorithm>
#include <string>
#include <string_view>

namespace kcenon::xdcc_client::benchmark {

namespace {

/**
 * @brief Build a stream shaped like a server reporting a long download
 * @param messages Number of progress messages
 * @param noisy Insert non-JSON lines between messages
 */
auto make_status_stream(std::size_t messages, bool noisy) -> std::string {
    constexpr uint64_t total = 734003200;
    std::string stream = R"({"status":"accepted","message":"Request queued"})" "\n";

    for (std::size_t i = 0; i < messages; ++i) {
        const auto percent = static_cast<int>(i * 100 / messages);
        const auto received = total / 100 * static_cast<uint64_t>(percent);
        stream += R"({"status":"progress","progress":)" + std::to_string(percent) +
                  R"(,"bytes_received":)" + std::to_string(received) +
                  R"(,"bytes_total":)" + std::to_string(total) +
                  R"(,"filename":"Show.S01E01.1080p.mkv"})" "\n";
        if (noisy && i % 4 == 0) {
            stream += "** DCC SEND queued, position 1 {retrying} **\n";
        }
    }

    stream += R"({"status":"success","filename":"Show.S01E01.1080p.mkv",)"
              R"("size":734003200,"path":"/downloads/Show.S01E01.1080p.mkv"})" "\n";
    return stream;
}

}  // namespace

/**
 * @brief Decoder throughput for various read sizes
 */
static void BM_FrameDecoder_Feed(::benchmark::State& state) {
    const auto read_size = static_cast<std::size_t>(state.range(0));
    const bool noisy = state.range(1) != 0;
    const auto stream = make_status_stream(1000, noisy);

    std::size_t frames = 0;
    for (auto _ : state) {
        frame_decoder decoder;
        frames = 0;

        std::string_view remaining(stream);
        while (!remaining.empty()) {
            const auto take = std::min(read_size, remaining.size());
            auto decoded = decoder.feed(remaining.substr(0, take));
            frames += decoded.size();
            ::benchmark::DoNotOptimize(decoded);
            remaining.remove_prefix(take);
        }
    }

    if (frames != 1002) {
        state.SkipWithError("Decoder lost frames");
        return;
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(frames) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Classification cost for a single progress frame
 */
static void BM_Classify_Progress(::benchmark::State& state) {
    const std::string payload =
        R"({"status":"progress","progress":"42","bytes_received":308281344,)"
        R"("bytes_total":734003200,"filename":"Show.S01E01.1080p.mkv"})";

    for (auto _ : state) {
        auto message = classify(payload);
        if (!message) {
            state.SkipWithError("Classification failed");
            return;
        }
        ::benchmark::DoNotOptimize(message.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Decode and classify a whole stream, as the session does
 */
static void BM_DecodeAndClassify(::benchmark::State& state) {
    const auto read_size = static_cast<std::size_t>(state.range(0));
    const auto stream = make_status_stream(1000, true);

    for (auto _ : state) {
        frame_decoder decoder;
        std::string_view remaining(stream);
        while (!remaining.empty()) {
            const auto take = std::min(read_size, remaining.size());
            for (const auto& f : decoder.feed(remaining.substr(0, take))) {
                auto message = classify(f);
                ::benchmark::DoNotOptimize(message);
            }
            remaining.remove_prefix(take);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_FrameDecoder_Feed)
    ->ArgsProduct({{1, 64, 512, 4096, 65536}, {0, 1}})
    ->ArgNames({"read_size", "noisy"})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Classify_Progress)->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_DecodeAndClassify)
    ->Arg(64)
    ->Arg(4096)
    ->ArgName("read_size")
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::xdcc_client::benchmark
