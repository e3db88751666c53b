#include "app/app.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        const std::string prog = argc > 0
            ? std::filesystem::path(argv[0]).filename().string()
            : "tokenmeter";
        const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

        return tokenmeter::run_app(args, std::cout, std::cerr, prog);

    } catch (const std::exception& e) {
        tokenmeter::utils::log::error(std::format("Fatal error: {}", e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return tokenmeter::kExitFatal;
    }
}
