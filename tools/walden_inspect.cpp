#include "walden/wal.hpp"
#include "walden/core/log.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using walden::wal::WalOptions;
using walden::wal::WriteAheadLog;

namespace {
struct Args {
    std::string base;
    bool stats{false};
    bool checkpoints{false};
    bool recover{false};
    std::optional<std::string> from;
    std::optional<std::string> log_level;
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "walden WAL inspector\n"
              << "Usage: walden_inspect --base=path [--stats] [--checkpoints] [--recover] [--from=checkpoint_id]\n"
              << "  [--log=off|error|warn|info|debug]\n"
              << "Opens the log (honouring WALDEN_WAL_* overrides), prints the requested views and closes it\n"
              << "without appending. With no view flag, --stats is implied.\n";
}
}

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        if (auto v = eat(a, "--base=")) { args.base = *v; continue; }
        if (a == "--stats") { args.stats = true; continue; }
        if (a == "--checkpoints") { args.checkpoints = true; continue; }
        if (a == "--recover") { args.recover = true; continue; }
        if (auto v = eat(a, "--from=")) { args.from = *v; args.recover = true; continue; }
        if (auto v = eat(a, "--log=")) { args.log_level = *v; continue; }
        std::cerr << "unknown argument: " << a << "\n";
        print_usage();
        return 2;
    }
    if (args.base.empty()) { print_usage(); return 2; }
    if (!args.stats && !args.checkpoints && !args.recover) args.stats = true;
    if (args.log_level) {
        auto lv = walden::core::parse_log_level(*args.log_level);
        if (!lv) { std::cerr << "invalid --log value: " << *args.log_level << "\n"; return 2; }
        walden::core::set_log_level(*lv);
    }

    WalOptions opts;
    opts.base_path = args.base;
    if (auto e = walden::wal::apply_env_overrides(opts); !e) {
        std::cerr << "config error: " << e.error().message << "\n";
        return 2;
    }
    auto wal = WriteAheadLog::open(opts);
    if (!wal) {
        std::cerr << "open failed [" << walden::core::to_string(wal.error().code) << "]: " << wal.error().message << "\n";
        return 1;
    }

    int rc = 0;
    if (args.checkpoints) {
        for (const auto& cp : (*wal)->list_checkpoints()) {
            std::cout << walden::wal::to_json(cp).dump() << "\n";
        }
    }
    if (args.recover) {
        std::optional<std::string_view> from;
        if (args.from) from = *args.from;
        auto ops = (*wal)->recover(from);
        if (!ops) {
            std::cerr << "recover failed [" << walden::core::to_string(ops.error().code) << "]: " << ops.error().message << "\n";
            rc = 1;
        } else {
            for (const auto& op : *ops) std::cout << op.dump() << "\n";
        }
    }
    if (args.stats) {
        std::cout << walden::wal::to_json((*wal)->stats()).dump(2) << "\n";
    }
    if (auto c = (*wal)->close(); !c) {
        std::cerr << "close failed: " << c.error().message << "\n";
        rc = 1;
    }
    return rc;
}
