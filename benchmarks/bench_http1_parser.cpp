/**
 * Request head, chunked body and multipart throughput
 */

#include "../src/cpp/http/http1_parser.h"
#include "../src/cpp/http/body_decoder.h"
#include "../src/cpp/http/multipart.h"
#include <iostream>
#include <chrono>
#include <cstring>
#include <string>
#include <string_view>

using namespace piping::http;
using namespace std::chrono;

template<typename Func>
double benchmark(const char* name, Func&& func, int iterations = 100000) {
    auto start = high_resolution_clock::now();

    for (int i = 0; i < iterations; ++i) {
        func();
    }

    auto end = high_resolution_clock::now();
    auto duration = duration_cast<nanoseconds>(end - start).count();
    double ns_per_op = static_cast<double>(duration) / iterations;

    std::cout << name << ": " << ns_per_op << " ns/op" << std::endl;

    return ns_per_op;
}

int main() {
    std::cout << "=== HTTP/1 head parsing ===" << std::endl;

    // curl -T style sender
    const char* sender_head =
        "PUT /mypath?n=2 HTTP/1.1\r\n"
        "Host: ppng.io\r\n"
        "User-Agent: curl/8.4.0\r\n"
        "Accept: */*\r\n"
        "Content-Length: 1048576\r\n"
        "Expect: 100-continue\r\n"
        "\r\n";

    // Browser receiver
    const char* receiver_head =
        "GET /mypath HTTP/1.1\r\n"
        "Host: ppng.io\r\n"
        "User-Agent: Mozilla/5.0 (X11; Linux x86_64)\r\n"
        "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8\r\n"
        "Accept-Language: en-US,en;q=0.5\r\n"
        "Accept-Encoding: gzip, deflate, br\r\n"
        "Connection: keep-alive\r\n"
        "Upgrade-Insecure-Requests: 1\r\n"
        "\r\n";

    HTTP1Parser parser;
    HTTP1Request request;
    size_t consumed = 0;

    double t1 = benchmark("  Sender head (5 headers)", [&]() {
        parser.reset();
        parser.parse(reinterpret_cast<const uint8_t*>(sender_head),
                     std::strlen(sender_head), request, consumed);
    });

    double t2 = benchmark("  Receiver head (7 headers)", [&]() {
        parser.reset();
        parser.parse(reinterpret_cast<const uint8_t*>(receiver_head),
                     std::strlen(receiver_head), request, consumed);
    });

    std::cout << "  Per-header: " << (t2 / 7) << " ns/header" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Body de-framing (64 KiB payload) ===" << std::endl;

    std::string payload(64 * 1024, 'x');
    std::string chunked;
    for (size_t offset = 0; offset < payload.size(); offset += 8192) {
        chunked += "2000\r\n";
        chunked.append(payload, offset, 8192);
        chunked += "\r\n";
    }
    chunked += "0\r\n\r\n";

    double t3 = benchmark("  Chunked decode", [&]() {
        BodyDecoder decoder = BodyDecoder::chunked();
        std::string_view input(chunked);
        while (!input.empty() && !decoder.done()) {
            auto step = decoder.decode(input);
            if (step.is_err() || step.value().consumed == 0) {
                break;
            }
            input.remove_prefix(step.value().consumed);
        }
    }, 5000);

    std::string form =
        "--bench\r\n"
        "Content-Disposition: form-data; name=\"input_file\"; filename=\"x.bin\"\r\n"
        "Content-Type: application/octet-stream\r\n"
        "\r\n" + payload + "\r\n--bench--\r\n";

    double t4 = benchmark("  Multipart first part", [&]() {
        MultipartExtractor extractor("bench");
        std::string_view input(form);
        while (!input.empty()) {
            std::string_view piece = input.substr(0, 16384);
            if (extractor.feed(piece).is_err()) {
                break;
            }
            input.remove_prefix(piece.size());
        }
    }, 5000);

    auto mib_per_s = [&](double ns) {
        return (static_cast<double>(payload.size()) / (1024.0 * 1024.0)) / (ns / 1e9);
    };

    std::cout << std::endl;
    std::cout << "=== Summary ===" << std::endl;
    std::cout << "  Sender head:     " << t1 << " ns" << std::endl;
    std::cout << "  Receiver head:   " << t2 << " ns" << std::endl;
    std::cout << "  Chunked decode:  " << mib_per_s(t3) << " MiB/s" << std::endl;
    std::cout << "  Multipart:       " << mib_per_s(t4) << " MiB/s" << std::endl;

    return 0;
}
