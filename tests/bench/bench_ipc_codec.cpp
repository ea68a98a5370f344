#include <benchmark/benchmark.h>
#include <string>
#include <vector>

#include "ipc/codec.hpp"

using namespace xplorer::ipc;

// ─── Data Helpers ────────────────────────────────────────────────────────────

// Listing shaped like an fs.list response with n entries.
static Value make_listing(size_t n)
{
    Value items = Value::array();
    for (size_t i = 0; i < n; ++i)
    {
        std::string name = "file_" + std::to_string(i) + ".txt";
        items.push_back(Value::object({
            {"name", name},
            {"path", "/home/user/documents/" + name},
            {"isDirectory", (i % 7) == 0},
            {"isHidden", false},
            {"size", static_cast<int64_t>(i * 1024)},
            {"modifiedAt", int64_t{1700000000000}},
            {"extension", ".txt"},
        }));
    }
    return items;
}

// ─── Encode ──────────────────────────────────────────────────────────────────

static void BM_EncodeListingResponse(benchmark::State& state)
{
    Response r;
    r.id      = "r42";
    r.success = true;
    r.data    = make_listing(static_cast<size_t>(state.range(0)));

    size_t bytes = 0;
    for (auto _ : state)
    {
        auto wire = encode_message(make_message(MessageType::RESPONSE, encode_response(r)));
        bytes     = wire.size();
        benchmark::DoNotOptimize(wire.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * bytes));
}
BENCHMARK(BM_EncodeListingResponse)->Arg(100)->Arg(1000)->Arg(10000);

// ─── Decode ──────────────────────────────────────────────────────────────────

static void BM_DecodeListingResponse(benchmark::State& state)
{
    Response r;
    r.id      = "r42";
    r.success = true;
    r.data    = make_listing(static_cast<size_t>(state.range(0)));
    auto wire = encode_message(make_message(MessageType::RESPONSE, encode_response(r)));

    for (auto _ : state)
    {
        auto msg      = decode_message(wire);
        auto response = decode_response(msg->payload);
        benchmark::DoNotOptimize(response->data.size());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * wire.size()));
}
BENCHMARK(BM_DecodeListingResponse)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_DecodeSmallRequest(benchmark::State& state)
{
    Request req{"r1", "fs.info", Value::object({{"path", "/home/user/documents/report.pdf"}})};
    auto    payload = encode_request(req);

    for (auto _ : state)
    {
        auto decoded = decode_request(payload);
        benchmark::DoNotOptimize(decoded->action.size());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DecodeSmallRequest);

BENCHMARK_MAIN();
