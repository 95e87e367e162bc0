#include "tfrecord/crc32c.hpp"
#include "tfrecord/record_io.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {
struct Args {
    bool tolerate_torn_tail{false};
    std::uint64_t max_record_bytes{0}; // 0 => TFRECORD_MAX_RECORD_BYTES or unlimited
    std::size_t dump{0};               // bytes of each payload to hex-dump
    std::size_t limit{0};              // 0 = all records
    std::vector<fs::path> files;
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static std::optional<std::uint64_t> parse_u64(const std::string& s) {
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

static void print_usage() {
    std::cout << "tfrecord_inspect: verify record files and print statistics\n"
              << "Usage: tfrecord_inspect [--tolerate_torn_tail] [--max_record_bytes=N]\n"
              << "  [--dump=N] [--limit=N] <file>...\n"
              << "Exit codes: 0 all files verified, 1 integrity or I/O error, 2 usage error\n";
}

static void hex_dump(std::span<const std::uint8_t> bytes, std::size_t n) {
    const std::size_t shown = bytes.size() < n ? bytes.size() : n;
    std::cout << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < shown; ++i) {
        std::cout << std::setw(2) << static_cast<unsigned>(bytes[i]) << (i + 1 < shown ? " " : "");
    }
    std::cout << std::dec << std::setfill(' ');
    if (shown < bytes.size()) std::cout << " ...";
    std::cout << "\n";
}
}

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        if (a == "--tolerate_torn_tail") { args.tolerate_torn_tail = true; continue; }
        if (auto v = eat(a, "--max_record_bytes=")) {
            auto n = parse_u64(*v);
            if (!n) { std::cerr << "invalid --max_record_bytes: " << *v << "\n"; return 2; }
            args.max_record_bytes = *n; continue;
        }
        if (auto v = eat(a, "--dump=")) {
            auto n = parse_u64(*v);
            if (!n) { std::cerr << "invalid --dump: " << *v << "\n"; return 2; }
            args.dump = static_cast<std::size_t>(*n); continue;
        }
        if (auto v = eat(a, "--limit=")) {
            auto n = parse_u64(*v);
            if (!n) { std::cerr << "invalid --limit: " << *v << "\n"; return 2; }
            args.limit = static_cast<std::size_t>(*n); continue;
        }
        if (a.rfind("--", 0) == 0) { std::cerr << "unknown option: " << a << "\n"; print_usage(); return 2; }
        args.files.emplace_back(a);
    }
    if (args.files.empty()) { print_usage(); return 2; }

    tfrecord::ScanOptions opts{};
    opts.tolerate_torn_tail = args.tolerate_torn_tail;
    opts.max_records = args.limit;
    if (args.max_record_bytes > 0) opts.decode.max_record_bytes = args.max_record_bytes;

    std::cout << "crc32c backend: " << tfrecord::crc32c_backend_name() << "\n";
    int rc = 0;
    for (const auto& file : args.files) {
        std::size_t idx = 0;
        auto st = tfrecord::scan_records(file, [&](std::span<const std::uint8_t> payload) {
            if (args.dump > 0) {
                std::cout << "  #" << idx << " len=" << payload.size() << " : ";
                hex_dump(payload, args.dump);
            }
            ++idx;
        }, opts);
        if (!st) {
            std::cerr << file.string() << ": " << tfrecord::core::describe(st.error()) << "\n";
            rc = 1;
            continue;
        }
        std::cout << file.string() << ": records=" << st->records
                  << " payload_bytes=" << st->payload_bytes
                  << " frame_bytes=" << st->frame_bytes
                  << " min_len=" << st->min_len
                  << " max_len=" << st->max_len
                  << (st->torn_tail ? " torn_tail=yes" : "") << "\n";
    }
    return rc;
}
