#include "bond.hpp"
#include "utils/hex.hpp"
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

class ConsoleLogger : public bondcpp::ILogger {
public:
    bool log(bondcpp::LogLevel level,
           std::string_view message,
           std::string_view operation,
           std::chrono::microseconds duration,
           size_t offset,
           std::string_view detail) override {
        std::cerr << "[" << level_name(level) << "] "
                  << message << " | "
                  << "operation: " << operation << " | "
                  << "duration: " << duration.count() << "us | "
                  << "offset: " << offset;
        if (!detail.empty()) {
            std::cerr << " | detail: " << detail;
        }
        std::cerr << std::endl;
        return true;
    }

private:
    static const char* level_name(bondcpp::LogLevel level) {
        switch (level) {
            case bondcpp::LogLevel::Debug: return "debug";
            case bondcpp::LogLevel::Info: return "info";
            case bondcpp::LogLevel::Warn: return "warn";
            case bondcpp::LogLevel::Error: return "error";
        }
        return "?";
    }
};

static void usage() {
    std::cerr << "usage: bond_dump [-v] [--lenient] [--check-length] (<file> | --hex <bytes>)" << std::endl;
}

int main(int argc, char** argv) {
    ConsoleLogger logger;
    bondcpp::set_logger(&logger);

    bondcpp::DecodeOptions options;
    std::string path;
    std::string hex;
    bool have_hex = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-v") {
            bondcpp::set_log_level_threshold(bondcpp::LogLevel::Debug);
        } else if (arg == "--lenient") {
            options.string_errors = bondcpp::StringErrorPolicy::Substitute;
        } else if (arg == "--check-length") {
            options.check_struct_length = true;
        } else if (arg == "--hex" && i + 1 < argc) {
            hex = argv[++i];
            have_hex = true;
        } else if (!arg.empty() && arg[0] != '-') {
            path = arg;
        } else {
            usage();
            return 2;
        }
    }
    if (path.empty() == !have_hex) {
        usage();
        return 2;
    }

    try {
        bondcpp::Value root;
        if (have_hex) {
            root = bondcpp::decode_base_struct(bondcpp::utils::hex_decode(hex), options);
        } else {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                std::cerr << "cannot open " << path << std::endl;
                return 1;
            }
            root = bondcpp::decode_base_struct(in, options);
        }
        std::cout << bondcpp::bond_json::to_json_string(root, true) << std::endl;
    } catch (const bondcpp::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    bondcpp::set_logger(nullptr);
    return 0;
}
