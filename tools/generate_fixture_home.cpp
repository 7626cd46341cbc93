// Создаёт синтетическую домашнюю папку для ручной проверки сканера:
//   generate_fixture_home [out_dir] [extra_dotfiles]
//   privascan hidden <out_dir> --pretty
#include <iostream>
#include <string>
#include "generator/FixtureGenerator.h"

int main(int argc, char** argv) {
    fs::path out_dir = (argc > 1) ? fs::path(argv[1]) : fs::path("fixture_home");
    size_t extra = 0;
    if (argc > 2) {
        try {
            extra = std::stoul(argv[2]);
        }
        catch (const std::exception&) {
            std::cerr << "extra_dotfiles must be a number: " << argv[2] << "\n";
            return 2;
        }
    }

    try {
        FixtureGenerator gen;
        FixtureStats stats = gen.generate(out_dir, extra);
        stats.print();
        std::cout << "Fixture home: " << fs::absolute(out_dir).string() << "\n";
    }
    catch (const std::exception& e) {
        std::cerr << "Не удалось создать фикстуру: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
