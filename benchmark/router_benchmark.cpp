#include "tanto/core/body_converter.hpp"
#include "tanto/core/dispatcher.hpp"
#include "tanto/core/router.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string_view>
#include <vector>

using namespace std::chrono;
using namespace tanto;
using namespace tanto::http;

struct benchmark_result {
    std::string name;
    double throughput;
    double latency_p50;
    double latency_p99;
    double latency_p999;
    uint64_t operations;
    uint64_t duration_ms;
    uint64_t errors;
};

void print_result(const benchmark_result& result) {
    std::cout << "\n=== " << result.name << " ===\n";
    std::cout << "Operations: " << result.operations << "\n";
    std::cout << "Duration: " << result.duration_ms << " ms\n";
    std::cout << "Throughput: " << std::fixed << std::setprecision(2) << result.throughput
              << " ops/sec\n";
    std::cout << "Errors: " << result.errors << "\n";
    if (result.latency_p50 > 0.0) {
        std::cout << "Latency p50: " << std::fixed << std::setprecision(3) << result.latency_p50
                  << " us\n";
        std::cout << "Latency p99: " << std::fixed << std::setprecision(3) << result.latency_p99
                  << " us\n";
        std::cout << "Latency p999: " << std::fixed << std::setprecision(3) << result.latency_p999
                  << " us\n";
    }
}

template <typename Op>
benchmark_result bench(const std::string& name,
                       const std::vector<std::string_view>& paths,
                       size_t iterations,
                       Op&& op) {
    std::vector<double> latencies;
    latencies.reserve(iterations);

    uint64_t errors = 0;
    auto start = steady_clock::now();

    for (size_t i = 0; i < iterations; ++i) {
        const auto path = paths[i % paths.size()];

        auto t0 = steady_clock::now();
        bool ok = op(path);
        auto t1 = steady_clock::now();

        if (!ok) {
            ++errors;
        }

        double latency_us =
            static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count()) / 1000.0;
        latencies.push_back(latency_us);
    }

    auto end = steady_clock::now();
    auto duration_ms = static_cast<uint64_t>(duration_cast<milliseconds>(end - start).count());

    std::sort(latencies.begin(), latencies.end());

    benchmark_result result;
    result.name = name;
    result.operations = iterations;
    result.duration_ms = duration_ms;
    result.throughput = (static_cast<double>(iterations) * 1000.0) /
                        static_cast<double>(std::max<uint64_t>(duration_ms, 1));
    result.latency_p50 = latencies[iterations / 2];
    result.latency_p99 = latencies[iterations * 99 / 100];
    result.latency_p999 = latencies[iterations * 999 / 1000];
    result.errors = errors;
    return result;
}

int main() {
    handler_fn ok_handler = [](request_context&) -> result<body_value> {
        return std::string("ok");
    };

    route_registry routes;
    for (const auto& added :
         {routes.get("/", ok_handler),
          routes.get("/users/me", ok_handler),
          routes.get("/users/{id:[0-9]+}", ok_handler),
          routes.get("/posts/{id}/comments/{cid}", ok_handler),
          routes.post("/posts", ok_handler),
          routes.get("/static/**", ok_handler),
          routes.get("/api/items", ok_handler, {.produces = {media_type::json(), media_type::html()}})}) {
        if (!added) {
            std::cerr << "route registration failed: " << added.error().message() << "\n";
            return 1;
        }
    }

    body_converter_registry converters;
    dispatcher d(routes, converters);
    d.on_error([](const request&, std::string_view) {});

    std::vector<std::string_view> happy_paths = {
        "/",
        "/users/me",
        "/users/42",
        "/posts/10/comments/5",
        "/static/css/site.css",
        "/api/items",
    };

    std::vector<std::string_view> not_found_paths = {
        "/missing",
        "/unknown/path",
        "/posts/10/comments",
        "/users/abc",
        "/static",
    };

    const size_t iterations = 200000;

    auto resolve_op = [&routes](std::string_view path) {
        return routes.resolve(method::get, path).match.has_value();
    };
    auto dispatch_op = [&d](std::string_view path) {
        request req(method::get, std::string(path));
        req.headers.add("Accept", "application/json, text/html;q=0.9, */*;q=0.1");
        response res;
        d.dispatch(req, res);
        return res.status < 400;
    };

    (void)bench("Warmup", happy_paths, 10000, resolve_op);

    auto hit = bench("Route resolve (hits)", happy_paths, iterations, resolve_op);
    auto miss = bench("Route resolve (not found)", not_found_paths, iterations, resolve_op);
    auto full = bench("Full dispatch (hits)", happy_paths, iterations, dispatch_op);

    print_result(hit);
    print_result(miss);
    print_result(full);

    return 0;
}
