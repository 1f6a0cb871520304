#include "cli/cli_parser.hpp"
#include "io/ppm_loader.hpp"
#include "io/ppm_saver.hpp"
#include "steg/steg_engine.hpp"

#include <iostream>

int main(int argc, char** argv) {
    try {
        ppmsteg::CliParser cli;
        cli.parse(argc, argv);
        std::string in = cli.get("in");
        if (in.empty() && cli.positional().size() == 1) in = cli.positional().front();
        const std::string out = cli.get("out");
        if (in.empty()) {
            std::cerr << "Usage: steg_unhide --in <stego.ppm> [--out <message file>]\n";
            return 1;
        }

        auto im = ppmsteg::load_ppm(in);
        auto msg = ppmsteg::unhide(im);
        if (out.empty()) {
            std::cout.write(reinterpret_cast<const char*>(msg.data()), static_cast<std::streamsize>(msg.size()));
            std::cout << "\n";
        } else {
            ppmsteg::write_file_bytes(out, msg);
            std::cout << "Wrote: " << out << " (" << msg.size() << " bytes)\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
