#include "commands/CacheDump.hpp"
#include "commands/order.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  bom-optimizer cache dump [path]\n"
        << "  bom-optimizer order [args]\n"
        << "  bom-optimizer help\n";
    return 1;
}

static int print_order_help() {
    std::cerr
        << "usage:\n"
        << "  bom-optimizer order --catalog <path> --order <path> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --catalog <path>             (required) parts catalog JSON\n"
        << "  --order <path>               (required) boards + board parts JSON\n"
        << "  --outdir <dir>               default: out\n"
        << "\n"
        << "quotes:\n"
        << "  --cache <path>               default: out/quote_cache.json\n"
        << "  --no_cache                   keep quotes in memory only\n"
        << "  --cache_ttl_hours <n>        default: 48\n"
        << "  --quotes_mock <dir>          canned quotes from dir (default: no quote source)\n"
        << "  --rates <path>               exchange rates JSON for --quotes_mock\n"
        << "\n"
        << "vendor reduction:\n"
        << "  --policy <path>              vendor policy JSON\n"
        << "  --shipping_threshold <f>     default: 15.00\n"
        << "  --never_exclude <str>        default: Digi-Key\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "cache" && argc >= 3 && std::string(argv[2]) == "dump") {
        const std::string path = (argc >= 4) ? argv[3] : "out/quote_cache.json";
        return cacheDump(path);
    }

    if (cmd == "order" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_order_help();

    if (cmd == "order") return cmd_order(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
